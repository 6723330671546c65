///
/// @file
/// @brief sForth - System Dependent Interface
///
///====================================================================
#include <sstream>                     /// iostream, stringstream
#include <cstring>
#include "sforth.h"
using namespace std;
///
///> output flushed through the VM callback
///
#define CALLBACK    fout_flush(vm)
#define ENDL        endl; CALLBACK
///====================================================================
///
///> I/O streaming interface
///
void fout_setup(VM &vm, void (*hook)(int, const char*)) {
    auto cb = [](int, const char *rst) { printf("%s", rst); fflush(stdout); };
    vm.fout_cb = hook ? hook : cb;     ///< console output hook up
}
void fout_flush(VM &vm) {
    string s = vm.fout.str();
    if (s.empty()) return;
    if (!vm.fout_cb) fout_setup(vm, NULL);

    vm.fout_cb((int)s.length(), s.c_str());
    vm.fout.str("");                   /// * clean output buffer
}
void outer(VM &vm, istream &in, const char *prompt) {
    string cmd;
    while (true) {
        if (prompt) { pstr(vm, prompt); CALLBACK; }
        if (!getline(in, cmd)) break;  ///> fetch user input
        if (forth_vm(vm, cmd.c_str())) break;
    }
}
///====================================================================
///
///> IO functions
///
void spaces(VM &vm, int n) { for (int i = 0; i < n; i++) vm.fout << " "; }
void dot(VM &vm, io_op op, DU v) {
    ostringstream &fout = vm.fout;
    switch (op) {
    case CR:    fout << ENDL;                           break;
    case DOT:   fout << v << " ";                       break;
    case EMIT:  { char b = (char)INT(v); fout << b; }   break;
    case SPCS:  spaces(vm, INT(v));                     break;
    default:    fout << "unknown io_op=" << op << ENDL; break;
    }
}
void pstr(VM &vm, const char *str, io_op op) {
    vm.fout << str;
    if (op==CR) { vm.fout << ENDL; }
}
///====================================================================
///
///> Debug functions
///
void ss_dump(VM &vm) {                    ///> display data stack, bottom first
    for (DU v : vm.ss) vm.fout << v << ' ';
}
static void _see(VM &vm, const Token &t) {   ///> decompile one resolved token
    ostringstream &fout = vm.fout;
    switch (t.type) {
    case T_NUM:  fout << t.n << ' ';                break;
    case T_OP:
    case T_PRIM: fout << prim_of(t)->name << ' ';   break;
    case T_DEF:                                     /// * nested snapshot
        fout << "[ ";
        for (auto &w : *t.pf) _see(vm, w);
        fout << "] ";                               break;
    default:     fout << t.name << ' ';             break;
    }
}
void see(VM &vm, const string &name) {
    ostringstream &fout = vm.fout;
    const Token *w = vm.dict.lookup(name);
    if (w && w->type==T_NUM) {
        fout << w->n << " constant " << name << ENDL;
        return;
    }
    if (w) {
        fout << ": " << name << ' ';
        for (auto &t : *w->pf) _see(vm, t);
        fout << ';' << ENDL;
        return;
    }
    optional<Token> p = find_prim(name);
    if (!p) throw forth_err(ERR_UNKNOWN, name);

    const Prim *x = prim_of(*p);
    fout << x->name << ' ' << x->desc << ENDL;
}
void words(VM &vm) {                      ///> display word list
    const int WIDTH = 60;
    ostringstream &fout = vm.fout;
    int x = 0;
    auto show = [&vm, &fout, &x](const char *nm) {
        fout << "  " << nm;
        x += ((int)strlen(nm) + 2);
        if (x > WIDTH) { fout << ENDL; x = 0; }
    };
    for (int i = 0; i < ops_sz;   i++) show(ops[i].name);
    for (int i = 0; i < prims_sz; i++) show(prims[i].name);
    for (auto &w : vm.dict)            show(w.name.c_str());
    fout << ENDL;
}
///====================================================================
