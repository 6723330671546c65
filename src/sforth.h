///
/// @file
/// @brief sForth header - C++ vector-based, snapshot-compiled float Forth
///
///====================================================================
#ifndef __SFORTH_SRC_SFORTH_H
#define __SFORTH_SRC_SFORTH_H
#include <iostream>                    /// cin, cout
#include <sstream>                     /// ostringstream
#include <iomanip>                     /// setprecision
#include <string>
#include <vector>                      /// vector
#include <optional>
#include <memory>                      /// shared_ptr
#include <stdexcept>                   /// runtime_error
#include "config.h"

using namespace std;

template<typename T>
struct FV : public vector<T> {      ///< our super-vector class
    FV *merge(FV<T> &v) {
        this->insert(this->end(), v.begin(), v.end()); v.clear(); return this;
    }
    void push(T n) { this->push_back(n); }
    T    pop()     { T n = this->back(); this->pop_back(); return n; }
    T    &operator[](int i) {
#if CC_DEBUG
        return this->at(i < 0 ? (this->size() + i) : i); // with range checked
#else  // !CC_DEBUG
        return vector<T>::operator[](i < 0 ? (this->size() + i) : i);
#endif // CC_DEBUG
    }
};
///====================================================================
///
///> error kinds, thrown as forth_err
///
typedef enum {
    ERR_DIV0=0,                    ///< division by zero
    ERR_UNDERFLOW,                 ///< not enough stack operands
    ERR_UNKNOWN,                   ///< word not in dictionary nor builtin
    ERR_INVALID,                   ///< malformed definition or entry
    ERR_UNTERMINATED,              ///< ':' without ';'
    ERR_QUIT                       ///< bye/quit, end of session
} err_code;

struct forth_err : public runtime_error {
    err_code code;                 ///< error kind
    string   word;                 ///< offending word or detail
    forth_err(err_code c, const string &w="");
};
///
///> Operators and builtins
///
typedef enum { opADD=0, opSUB, opMUL, opDIV } math_op;
typedef enum {
    opDROP=0, opDUP, opSWAP, opOVER, opROT,
    opDDROP, opDDUP, opDOVER, opDSWAP,
    opEMIT, opCR, opSPACE, opSPCS, opDOT, opDOTS,
    opBYE, opQUIT, opMOD, opSLMOD,
    opNIP, opMROT, opNEGATE, opABS, opMAX, opMIN,
    opDEPTH, opWORDS
} prim_op;

struct Prim {                      ///> builtin name table entry
    const char *name;              ///< lower-case name
    const char *desc;              ///< stack effect
    U8         op;                 ///< math_op or prim_op
    U8         arity;              ///< operands checked before any pop
};
///
///> Token - tagged value produced by the compiler
///
typedef enum {
    T_NUM=0,                       ///< number literal
    T_OP,                          ///< arithmetic operator
    T_PRIM,                        ///< builtin
    T_WORD,                        ///< unresolved reference
    T_DEF,                         ///< resolved definition body
    T_BLOCK,                       ///< raw ': name ... ;' capture
    T_CONST,                       ///< n constant name
    T_SEE                          ///< see name
} tok_type;

struct Token;
typedef shared_ptr<const FV<Token>> Body;  ///< immutable once compiled

struct Token {
    tok_type  type;
    DU        n    = DU0;          ///< T_NUM value
    U8        op   = 0;            ///< T_OP, T_PRIM opcode
    string    name;                ///< T_WORD, T_BLOCK, T_CONST, T_SEE name
    Body      pf;                  ///< T_DEF, T_BLOCK body, shared by snapshots

    static Token num(DU v)                 { Token t { T_NUM };  t.n  = v; return t; }
    static Token math(math_op o)           { Token t { T_OP };   t.op = o; return t; }
    static Token prim(prim_op o)           { Token t { T_PRIM }; t.op = o; return t; }
    static Token ref(tok_type y, const string &s) { Token t { y }; t.name = s; return t; }
};
///
///> Dictionary - name to Number or Definition
///
struct Word {
    string name;                   ///< lower-case name
    Token  val;                    ///< T_NUM or T_DEF
};

struct Dict : public FV<Word> {
    const Token *lookup(const string &name) const;
    void        define(const string &name, const Token &val);
};
///====================================================================
///
///> VM context - one per session
///
struct VM {
    FV<DU>        ss;              ///< data stack
    Dict          dict;            ///< user dictionary
    ostringstream fout;            ///< forth output buffer
    void (*fout_cb)(int, const char*) = NULL;  ///< output callback

    VM() { fout << setprecision(15); }  ///< full double digits on output
};
///
///> Forth core
///
extern const Prim ops[];                  ///< operators + - * /
extern const Prim prims[];                ///< builtin table
extern const int  ops_sz;
extern const int  prims_sz;

optional<Token> find_prim(const string &name);        ///< operator or builtin by name
const Prim  *prim_of(const Token &t);                 ///< table entry by opcode
bool         parse_number(const char *s, DU *n);
FV<string>   lex(const string &line);
FV<Token>    compile(VM &vm, const FV<string> &lexemes);
optional<DU> run(VM &vm, const FV<Token> &tokens);
optional<DU> forth_eval(VM &vm, const string &line);
///
///> System interface
///
void fout_setup(VM &vm, void (*hook)(int, const char*));
void fout_flush(VM &vm);
int  forth_vm(VM &vm, const char *line);  ///< eval and report, 1=quit
void outer(VM &vm, istream &in, const char *prompt=NULL); ///< Forth outer loop
///
///> IO functions
///
typedef enum { CR=0, DOT, EMIT, SPCS } io_op;

void spaces(VM &vm, int n);               ///< show spaces
void dot(VM &vm, io_op op, DU v=DU0);     ///< print literals
void pstr(VM &vm, const char *str, io_op op=SPCS); ///< print string
///
///> Debug functions
///
void ss_dump(VM &vm);                     ///< show data stack content
void see(VM &vm, const string &name);     ///< disassemble a word
void words(VM &vm);                       ///< list dictionary words
#endif  // __SFORTH_SRC_SFORTH_H
