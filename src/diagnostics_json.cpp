#include "ksc/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace ksc {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_notes(std::ostringstream& os, const std::vector<CompileNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)<<"}";
    }
    os<<"]";
}

// Fields shared by errors and warnings.
template<class D>
static void append_common(std::ostringstream& os, const D& d){
    os<<"\"code\":"<<json_escape(d.code)
      <<",\"message\":"<<json_escape(d.message)
      <<",\"hint\":"<<json_escape(d.hint)
      <<",\"line\":"<<d.line
      <<",\"col\":"<<d.col
      <<",\"notes\":";
    append_notes(os, d.notes);
}

std::string diagnostics_to_json(const CompileResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){
        const auto &e=r.errors[i]; if(i) os<<",";
        os<<"{";
        append_common(os, e);
        if(!e.name.empty()) os<<",\"name\":"<<json_escape(e.name);
        if(!e.expected.empty()) os<<",\"expected\":"<<json_escape(e.expected);
        if(!e.actual.empty()) os<<",\"actual\":"<<json_escape(e.actual);
        os<<"}";
    }
    os<<"],\"warnings\":[";
    for(size_t i=0;i<r.warnings.size(); ++i){
        if(i) os<<",";
        os<<"{";
        append_common(os, r.warnings[i]);
        os<<"}";
    }
    os<<"]}";
    return os.str();
}

void print_json(const CompileResult& r){
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace ksc
