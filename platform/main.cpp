///
/// @file
/// @brief sForth console driver for Desktop PC (Linux and Cygwin)
///
#include <iostream>      // cin, cout
#include "sforth.h"

using namespace std;
///====================================================================
///
/// main program - one session per process
///
int main(int ac, char* av[]) {
    VM vm;                              ///< session stack and dictionary
    fout_setup(vm, NULL);               ///> console output
    cout << APP_VERSION << endl;        ///> banner

    outer(vm, cin, "> ");
    cout << "Done!" << endl;
    return 0;
}
///====================================================================
