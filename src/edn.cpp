// EDN reader for the AST interchange format (lists, vectors, symbols, keywords, strings, numbers).
#include "ksc/edn.hpp"
#include <cctype>
#include <sstream>

namespace ksc {

namespace {

struct reader {
    std::string_view d;
    size_t p = 0;
    int line = 1, col = 1;
    explicit reader(std::string_view s) : d(s) {}
    bool eof() const { return p >= d.size(); }
    char peek() const { return eof() ? '\0' : d[p]; }
    char get(){
        if(eof()) return '\0';
        char c = d[p++];
        if(c=='\n'){ ++line; col = 1; } else ++col;
        return c;
    }
    void skip_ws(){
        while(!eof()){
            char c = peek();
            if(c==';'){ while(!eof() && get()!='\n'){} continue; }
            // commas are whitespace in EDN
            if(c==' '||c=='\t'||c=='\r'||c=='\n'||c=='\f'||c=='\v'||c==','){ get(); continue; }
            break;
        }
    }
    [[noreturn]] void fail(const std::string& msg) const {
        throw parse_error(std::to_string(line) + ":" + std::to_string(col) + ": " + msg);
    }
};

bool is_digit(char c){ return c>='0' && c<='9'; }
bool is_symbol_start(char c){ return std::isalpha((unsigned char)c) || c=='*' || c=='!' || c=='_' || c=='?' || c=='-' || c=='+' || c=='/' || c=='<' || c=='>' || c=='=' || c=='$' || c=='%' || c=='&'; }
bool is_symbol_char(char c){ return is_symbol_start(c) || is_digit(c) || c=='.' || c=='#'; }

node_ptr make_node(node_data d, int line, int col){
    auto n = std::make_shared<node>();
    n->data = std::move(d); n->line = line; n->col = col;
    return n;
}

node_ptr parse_value(reader& r);

node_ptr parse_seq(reader& r, char end, int sl, int sc){
    std::vector<node_ptr> elems;
    r.skip_ws();
    while(!r.eof() && r.peek()!=end){ elems.push_back(parse_value(r)); r.skip_ws(); }
    if(r.get()!=end) r.fail("unterminated collection");
    if(end==')') return make_node(list{std::move(elems)}, sl, sc);
    return make_node(vector_t{std::move(elems)}, sl, sc);
}

node_ptr parse_string(reader& r){
    int sl = r.line, sc = r.col;
    r.get(); // opening quote
    std::string out;
    for(;;){
        if(r.eof()) r.fail("unterminated string");
        char c = r.get();
        if(c=='"') break;
        if(c!='\\'){ out += c; continue; }
        if(r.eof()) r.fail("bad escape");
        char e = r.get();
        switch(e){
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case '0': out += '\0'; break;
            default: out += e; break;
        }
    }
    return make_node(out, sl, sc);
}

node_ptr parse_number(reader& r){
    int sl = r.line, sc = r.col;
    std::string num;
    if(r.peek()=='+' || r.peek()=='-') num += r.get();
    bool is_float = false;
    while(is_digit(r.peek())) num += r.get();
    if(r.peek()=='.'){ is_float = true; num += r.get(); while(is_digit(r.peek())) num += r.get(); }
    if(r.peek()=='e' || r.peek()=='E'){
        is_float = true; num += r.get();
        if(r.peek()=='+' || r.peek()=='-') num += r.get();
        while(is_digit(r.peek())) num += r.get();
    }
    try {
        if(is_float) return make_node(std::stod(num), sl, sc);
        return make_node((int64_t)std::stoll(num), sl, sc);
    } catch(const std::exception&){
        r.fail("invalid number '" + num + "'");
    }
}

node_ptr parse_symbol_or_keyword(reader& r){
    int sl = r.line, sc = r.col;
    bool kw = false;
    if(r.peek()==':'){ kw = true; r.get(); }
    std::string s;
    while(is_symbol_char(r.peek())) s += r.get();
    if(s.empty()) r.fail("empty symbol");
    if(kw) return make_node(keyword{s}, sl, sc);
    if(s=="nil") return make_node(std::monostate{}, sl, sc);
    if(s=="true") return make_node(true, sl, sc);
    if(s=="false") return make_node(false, sl, sc);
    return make_node(symbol{s}, sl, sc);
}

node_ptr parse_value(reader& r){
    r.skip_ws();
    char c = r.peek();
    if(r.eof()) r.fail("unexpected end of input");
    if(c=='"') return parse_string(r);
    if(c=='(' || c=='['){
        int sl = r.line, sc = r.col; r.get();
        return parse_seq(r, c=='(' ? ')' : ']', sl, sc);
    }
    // '+'/'-' start a number only when a digit follows; otherwise they are operator symbols
    if(is_digit(c)) return parse_number(r);
    if((c=='+' || c=='-') && r.p+1 < r.d.size() && is_digit(r.d[r.p+1])) return parse_number(r);
    if(c==':' || is_symbol_start(c)) return parse_symbol_or_keyword(r);
    r.fail(std::string("unexpected character '") + c + "'");
}

} // namespace

node_ptr parse(std::string_view input){
    reader r(input);
    auto v = parse_value(r);
    r.skip_ws();
    if(!r.eof()) r.fail("unexpected trailing characters");
    return v;
}

std::string to_string(const node_ptr& n){
    if(!n) return "nil";
    struct V {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { std::ostringstream oss; oss << d; return oss.str(); }
        std::string operator()(const std::string& s) const { return '"' + s + '"'; }
        std::string operator()(const keyword& k) const { return ':' + k.name; }
        std::string operator()(const symbol& s) const { return s.name; }
        std::string join(const std::vector<node_ptr>& elems, char open, char close) const {
            std::string out(1, open);
            for(size_t i=0;i<elems.size();++i){ if(i) out += ' '; out += to_string(elems[i]); }
            out += close;
            return out;
        }
        std::string operator()(const list& l) const { return join(l.elems, '(', ')'); }
        std::string operator()(const vector_t& v) const { return join(v.elems, '[', ']'); }
    };
    return std::visit(V{}, n->data);
}

} // namespace ksc
