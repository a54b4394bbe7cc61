#include "stagec/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace stagec {

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

static void append_diagnostics_json(std::ostringstream& os, const std::vector<CompileError>& list){
    os<<"[";
    for(size_t i=0;i<list.size(); ++i){
        const auto &e=list[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(e.code)
            <<",\"message\":"<<json_escape(e.message)
            <<",\"hint\":"<<json_escape(e.hint)
            <<",\"function\":"<<json_escape(e.function)
            <<",\"pc\":"<<e.pc
            <<"}";
    }
    os<<"]";
}

std::string diagnostics_to_json(const CompileResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":";
    append_diagnostics_json(os, r.errors);
    os<<",\"warnings\":";
    append_diagnostics_json(os, r.warnings);
    os<<"}";
    return os.str();
}

void maybe_print_json(const CompileResult& r, const CompileEnv& env){
    if(!env.diagJson) return;
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace stagec
