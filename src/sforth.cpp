///
/// @file
/// @brief sForth - C++ vector-based, snapshot-compiled float Forth
///
///====================================================================
#include <sstream>                     /// iostream, stringstream
#include <cstring>
#include <cctype>                      /// isspace, tolower
#include <cerrno>
#include <cstdlib>                     /// strtod, strtol
#include "sforth.h"

using namespace std;
///
///> macros to reduce verbosity (but harder to single-step debug)
///
#define SS          (vm.ss)
#define TOS         (vm.ss[-1])
#define PUSH(v)     (SS.push((DU)(v)))
#define POP()       (SS.pop())
#define NEED(n)     if ((int)SS.size() < (int)(n)) throw forth_err(ERR_UNDERFLOW)
#define DIV0(v)     if (ZEQ(v)) throw forth_err(ERR_DIV0)
#define CHAR(v)     if (!isfinite(v) || (v) < DU0 || (v) > 255.0) \
                        throw forth_err(ERR_INVALID, "emit out of range")
#define SPCS_OK(v)  if (!isfinite(v) || (v) > SF_SPCS_MAX) \
                        throw forth_err(ERR_INVALID, "spaces out of range")
///
///> Builtin tables
/// @note: entries must follow math_op and prim_op order, opcode is the index
///
const Prim ops[] {
    { "+",      "( a b -- a+b )",            opADD,    2 },
    { "-",      "( a b -- a-b )",            opSUB,    2 },
    { "*",      "( a b -- a*b )",            opMUL,    2 },
    { "/",      "( a b -- a/b )",            opDIV,    2 },
};
const Prim prims[] {
    /// @defgroup Data Stack ops
    /// @{
    { "drop",   "( a -- )",                  opDROP,   1 },
    { "dup",    "( a -- a a )",              opDUP,    1 },
    { "swap",   "( a b -- b a )",            opSWAP,   2 },
    { "over",   "( a b -- a b a )",          opOVER,   2 },
    { "rot",    "( a b c -- b c a )",        opROT,    3 },
    /// @}
    /// @defgroup Data Stack ops - double
    /// @{
    { "2drop",  "( a b -- )",                opDDROP,  2 },
    { "2dup",   "( a b -- a b a b )",        opDDUP,   2 },
    { "2over",  "( a b c d -- a b c d a b )",opDOVER,  4 },
    { "2swap",  "( a b c d -- c d a b )",    opDSWAP,  4 },
    /// @}
    /// @defgroup IO ops
    /// @{
    { "emit",   "( n -- )",                  opEMIT,   1 },
    { "cr",     "( -- )",                    opCR,     0 },
    { "space",  "( -- )",                    opSPACE,  0 },
    { "spaces", "( n -- )",                  opSPCS,   1 },
    { ".",      "( n -- )",                  opDOT,    1 },
    { ".s",     "( -- )",                    opDOTS,   0 },
    { "bye",    "( -- )",                    opBYE,    0 },
    { "quit",   "( -- )",                    opQUIT,   0 },
    /// @}
    /// @defgroup ALU ops
    /// @{
    { "mod",    "( a b -- a%b )",            opMOD,    2 },
    { "/mod",   "( a b -- a%b a/b )",        opSLMOD,  2 },
    { "nip",    "( a b -- b )",              opNIP,    2 },
    { "-rot",   "( a b c -- c a b )",        opMROT,   3 },
    { "negate", "( a -- -a )",               opNEGATE, 1 },
    { "abs",    "( a -- |a| )",              opABS,    1 },
    { "max",    "( a b -- max )",            opMAX,    2 },
    { "min",    "( a b -- min )",            opMIN,    2 },
    /// @}
    /// @defgroup Debug ops
    /// @{
    { "depth",  "( -- n )",                  opDEPTH,  0 },
    { "words",  "( -- )",                    opWORDS,  0 },
    /// @}
};
const int ops_sz   = (int)(sizeof(ops) / sizeof(Prim));
const int prims_sz = (int)(sizeof(prims) / sizeof(Prim));
static_assert(sizeof(ops)   / sizeof(Prim) == opDIV + 1,   "ops[] out of sync");
static_assert(sizeof(prims) / sizeof(Prim) == opWORDS + 1, "prims[] out of sync");
///====================================================================
///
///> Error class
///
static string _err_msg(err_code c, const string &w) {
    switch (c) {
    case ERR_DIV0:         return "Division by zero";
    case ERR_UNDERFLOW:    return "Stack underflow";
    case ERR_UNKNOWN:      return "Unknown word: " + w;
    case ERR_INVALID:      return "Invalid word: " + w;
    case ERR_UNTERMINATED: return "Unterminated definition";
    case ERR_QUIT:         return "Bye";
    }
    return "?";
}
forth_err::forth_err(err_code c, const string &w)
    : runtime_error(_err_msg(c, w)), code(c), word(w) {}
///====================================================================
///
///> Dictionary
///
const Token *Dict::lookup(const string &name) const {
    for (auto w = rbegin(); w != rend(); ++w) {    ///> scan dictionary, last to first
        if (STRCMP(name.c_str(), w->name.c_str())==0) return &w->val;
    }
    return NULL;                                   /// * word not found
}
void Dict::define(const string &name, const Token &val) {
    if (val.type != T_NUM && val.type != T_DEF) {
        throw forth_err(ERR_INVALID, name);        /// * only values and bodies stored
    }
    string nm(name);
    for (auto &c : nm) c = (char)tolower((U8)c);

    for (auto &w : *this) {
        if (STRCMP(nm.c_str(), w.name.c_str())) continue;
        w.val = val;                               /// * overwrite, old bodies stay shared
        return;
    }
    push({ nm, val });
}
///====================================================================
///
///> Builtin lookup
///
optional<Token> find_prim(const string &name) {
    const char *s = name.c_str();
    for (int i = 0; i < ops_sz; i++) {
        if (STRCMP(s, ops[i].name)==0) return Token::math((math_op)ops[i].op);
    }
    for (int i = 0; i < prims_sz; i++) {
        if (STRCMP(s, prims[i].name)==0) return Token::prim((prim_op)prims[i].op);
    }
    return {};
}
const Prim *prim_of(const Token &t) {
    switch (t.type) {
    case T_OP:   return &ops[t.op];
    case T_PRIM: return &prims[t.op];
    default:     return NULL;
    }
}
///====================================================================
///
///> Forth inner interpreter
///
static optional<DU> _math(VM &vm, math_op op) {
    NEED(2);                                       /// * check before any pop
    if (op==opDIV) { DIV0(TOS); }
    DU b = POP();                                  ///< b is nearer the top
    DU a = POP();
    switch (op) {
    case opADD: return a + b;
    case opSUB: return a - b;
    case opMUL: return a * b;
    case opDIV: return a / b;
    }
    throw forth_err(ERR_INVALID, "operator");
}

static optional<DU> _prim(VM &vm, prim_op op) {
    NEED(prims[op].arity);                         /// * atomic, no partial pop
    switch (op) {
    case opDROP:   POP();                          return {};
    case opDUP:                                    return TOS;
    case opSWAP:   { DU b = POP(); DU a = POP(); PUSH(b); return a; }
    case opOVER:                                   return SS[-2];
    case opROT:    { DU c = POP(); DU b = POP(); DU a = POP();
                     PUSH(b); PUSH(c); return a; }
    case opDDROP:  POP(); POP();                   return {};
    case opDDUP:   { DU a = SS[-2]; DU b = SS[-1]; PUSH(a); return b; }
    case opDOVER:  { DU a = SS[-4]; DU b = SS[-3]; PUSH(a); return b; }
    case opDSWAP:  { DU d = POP(); DU c = POP(); DU b = POP(); DU a = POP();
                     PUSH(c); PUSH(d); PUSH(a); return b; }
    case opEMIT:   { CHAR(TOS); dot(vm, EMIT, POP()); return {}; }
    case opCR:     dot(vm, CR);                    return {};
    case opSPACE:  dot(vm, SPCS, DU1);             return {};
    case opSPCS:   { SPCS_OK(TOS); DU n = POP(); dot(vm, SPCS, n < DU0 ? DU0 : n); return {}; }
    case opDOT:    dot(vm, DOT, POP());            return {};
    case opDOTS:   ss_dump(vm);                    return {};
    case opBYE:
    case opQUIT:   throw forth_err(ERR_QUIT);
    case opMOD:    { DIV0(TOS); DU b = POP(); DU a = POP(); return MOD(a, b); }
    case opSLMOD:  { DIV0(TOS); DU b = POP(); DU a = POP();
                     PUSH(MOD(a, b)); return a / b; }
    case opNIP:    { DU b = POP(); POP(); return b; }
    case opMROT:   { DU c = POP(); DU b = POP(); DU a = POP();
                     PUSH(c); PUSH(a); return b; }
    case opNEGATE:                                 return -POP();
    case opABS:                                    return ABS(POP());
    case opMAX:    { DU b = POP(); DU a = POP(); return (a > b) ? a : b; }
    case opMIN:    { DU b = POP(); DU a = POP(); return (a < b) ? a : b; }
    case opDEPTH:                                  return (DU)SS.size();
    case opWORDS:  words(vm);                      return {};
    }
    throw forth_err(ERR_INVALID, "builtin");
}

static optional<DU> _exec(VM &vm, const Token &t);

static void _nest(VM &vm, const FV<Token> &pf) {         ///> run a resolved body
    for (auto &t : pf) {
        optional<DU> v = _exec(vm, t);
        if (v) PUSH(*v);
    }
}
static optional<DU> _call(VM &vm, const Token &w) {      ///> run a dictionary entry
    switch (w.type) {
    case T_NUM: return w.n;                        /// * constant or variable
    case T_DEF: {
        Body pf = w.pf;                            /// * hold the body while it runs
        _nest(vm, *pf);
        return {};
    }
    default:    throw forth_err(ERR_INVALID, "dictionary entry");
    }
}
static optional<DU> _exec(VM &vm, const Token &t) {
    switch (t.type) {
    case T_NUM:   return t.n;
    case T_OP:    return _math(vm, (math_op)t.op);
    case T_PRIM:  return _prim(vm, (prim_op)t.op);
    case T_DEF:   _nest(vm, *t.pf); return {};     /// * nested snapshot
    case T_WORD: {
        const Token *w = vm.dict.lookup(t.name);
        if (w) return _call(vm, *w);
        optional<Token> p = find_prim(t.name);
        if (p) return _exec(vm, *p);
        throw forth_err(ERR_UNKNOWN, t.name);
    }
    case T_CONST: {
        NEED(1);
        vm.dict.define(t.name, Token::num(POP()));
        return {};
    }
    case T_SEE:   see(vm, t.name); return {};
    case T_BLOCK: break;
    }
    throw forth_err(ERR_INVALID, t.name);          /// * blocks are compiler only
}
///
///> run a top-level token list, value of the last token returned
///
optional<DU> run(VM &vm, const FV<Token> &tokens) {
    optional<DU> v;
    for (auto &t : tokens) {
        if (t.type==T_DEF || t.type==T_BLOCK) {
            throw forth_err(ERR_INVALID, "definition at top level");
        }
        v = _exec(vm, t);
        if (v) PUSH(*v);
    }
    return v;
}
///====================================================================
///
///> Forth outer interpreter - lexer and compiler
///
FV<string> lex(const string &line) {
    FV<string> lx;
    if (line.empty()) return lx;

    string s;
    for (char c : line) {
        if (isspace((U8)c)) { lx.push(s); s.clear(); }  /// * runs give empty lexemes
        else s += (char)tolower((U8)c);
    }
    lx.push(s);
    return lx;
}

bool parse_number(const char *s, DU *n) {
    int b = 0;
    switch (*s) {                                  ///> base override
    case '%': b = 2;  s++; break;
    case '&':
    case '#': b = 10; s++; break;
    case '$': b = 16; s++; break;
    }
    if (*s=='\0' || isspace((U8)*s)) return false;

    char *p;
    DU   v;
    if (b) {
        errno = 0;                                 ///> clear overflow flag
        v = static_cast<DU>(strtol(s, &p, b));
        if (errno) return false;
    }
    else {
        const char *d = (*s=='-' || *s=='+') ? s + 1 : s;
        if (d[0]=='0' && tolower((U8)d[1])=='x') return false;  /// * no C hex floats
        v = strtod(s, &p);                         /// * overflow gives inf
    }
    if (*p != '\0') return false;

    *n = v;
    return true;
}

static int _comment(const FV<string> &lx, int i) { ///> skip ( ... ), return index of ')'
    int n = (int)lx.size();
    while (++i < n) {
        const string &s = lx.at(i);
        if (s.size() && s.back()==')') return i;
    }
    return n;                                      /// * unclosed, eats the line
}

static int _name(const FV<string> &lx, int i, string &name) {
    int n = (int)lx.size();
    while (++i < n && lx.at(i).empty());           /// * skip empty lexemes
    if (i >= n) return -1;

    DU v;
    name = lx.at(i);
    if (parse_number(name.c_str(), &v)) throw forth_err(ERR_INVALID, name);
    return i;
}

static Token _literal(const string &s) {
    DU n;
    if (parse_number(s.c_str(), &n)) return Token::num(n);
    optional<Token> p = find_prim(s);
    if (p) return *p;
    return Token::ref(T_WORD, s);                  /// * resolved when run
}

static Token _resolve(VM &vm, const string &s) {   ///> snapshot a body reference
    const Token *w = vm.dict.lookup(s);
    if (w) return *w;                              /// * current meaning, shared body

    Token t = _literal(s);
    if (t.type==T_WORD) throw forth_err(ERR_UNKNOWN, s);
    return t;
}
///
///> capture ': name ... ;' into a block, return index of ';'
///
static int _block(const FV<string> &lx, int i, Token &blk) {
    i = _name(lx, i, blk.name);
    if (i < 0) throw forth_err(ERR_UNTERMINATED);
    if (blk.name==";") throw forth_err(ERR_INVALID, "missing name");

    auto raw = make_shared<FV<Token>>();
    for (int n = (int)lx.size(); ++i < n;) {
        const string &s = lx.at(i);
        if (s.empty())  continue;
        if (s=="(")     { i = _comment(lx, i); continue; }
        if (s=="\\")    break;
        if (s==":")     throw forth_err(ERR_INVALID, "nested definition");
        if (s==";")     { blk.pf = raw; return i; }
        raw->push(Token::ref(T_WORD, s));
    }
    throw forth_err(ERR_UNTERMINATED);
}

static void _close(VM &vm, const Token &blk) {     ///> resolve and install a block
    auto pf = make_shared<FV<Token>>();
    for (auto &t : *blk.pf) pf->push(_resolve(vm, t.name));

    if (pf->size()==1 && (*pf)[0].type==T_NUM) {
        vm.dict.define(blk.name, (*pf)[0]);        /// * single literal acts as a variable
    }
    else {
        Token def { T_DEF };
        def.pf = pf;
        vm.dict.define(blk.name, def);
    }
#if CC_DEBUG > 1
    LOG_HDR("_close", blk.name.c_str()); LOG_KV("pf.size=", pf->size()); LOGS("\n");
#endif // CC_DEBUG > 1
}

FV<Token> compile(VM &vm, const FV<string> &lexemes) {
    FV<Token> tokens;
    int n = (int)lexemes.size();
    for (int i = 0; i < n; i++) {
        const string &s = lexemes.at(i);
        if (s.empty())  continue;
        if (s=="(")     { i = _comment(lexemes, i); continue; }
        if (s=="\\")    break;                     /// * comment to end of line
        if (s==";")     throw forth_err(ERR_INVALID, "; without :");
        if (s==":") {                              /// * definition block
            Token blk { T_BLOCK };
            i = _block(lexemes, i, blk);
            _close(vm, blk);                       /// * consumed, never emitted
            continue;
        }
        if (s=="constant" || s=="see") {           /// * name follows
            string nm;
            int j = _name(lexemes, i, nm);
            if (j < 0) throw forth_err(ERR_INVALID, s + " needs a name");
            tokens.push(Token::ref(s=="see" ? T_SEE : T_CONST, nm));
            i = j;
            continue;
        }
        tokens.push(_literal(s));
    }
    return tokens;
}
///====================================================================
///
///> Forth VM - interface to outside world
///
optional<DU> forth_eval(VM &vm, const string &line) {
    if (line.find_first_not_of(" \t\r\n\v\f")==string::npos) return {};

    FV<Token> tokens = compile(vm, lex(line));
    return run(vm, tokens);
}

int forth_vm(VM &vm, const char *line) {
    int quit = 0;
    try {
        optional<DU> v = forth_eval(vm, line);
        if (v) vm.fout << *v;
        vm.fout << " Ok" << endl;
    }
    catch (forth_err &e) {
        if (e.code==ERR_QUIT) quit = 1;            /// * end of session
        else vm.fout << "? Error: " << e.what() << endl;
    }
    catch (exception &e) {
        vm.fout << "? Error: " << e.what() << endl;
    }
    fout_flush(vm);

    return quit;
}
