#include "stagec/text_reader.hpp"

#include <fstream>
#include <sstream>

#include <tao/pegtl.hpp>

#include "actions.hpp"
#include "grammar.hpp"

namespace stagec::text {
using namespace stagec::text::grammar;
using namespace stagec::text::actions;

static ReadResult failure(std::string message, std::size_t line, std::size_t column){
    ReadResult r;
    r.success = false;
    r.error_message = std::move(message);
    r.line = static_cast<int>(line);
    r.column = static_cast<int>(column);
    return r;
}

ReadResult read_module(std::string_view src, std::string_view filename){
    tao::pegtl::memory_input<> in(src.data(), src.size(), std::string(filename));
    build_state st;
    try {
        tao::pegtl::parse< module_rule, action >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        return failure(e.what(), p.line, p.column);
    }
    for(auto& c : st.calls){
        std::size_t target = st.module.functions.size();
        for(std::size_t i = 0; i < st.module.functions.size(); ++i)
            if(st.module.functions[i].name == c.target){ target = i; break; }
        if(target == st.module.functions.size())
            return failure(c.pos.source + ":" + std::to_string(c.pos.line) + ":" + std::to_string(c.pos.column) +
                               ": unknown call target '" + c.target + "'",
                           c.pos.line, c.pos.column);
        st.module.functions[c.fn].code[c.pc].imm = static_cast<int64_t>(target);
    }
    ReadResult r;
    r.success = true;
    r.module = std::move(st.module);
    return r;
}

ReadResult read_module_file(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    if(!f) return failure("cannot open " + path, 0, 0);
    std::ostringstream ss;
    ss << f.rdbuf();
    const std::string src = ss.str();
    return read_module(src, path);
}

} // namespace stagec::text
