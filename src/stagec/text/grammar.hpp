#pragma once
#include <tao/pegtl.hpp>

namespace stagec::text::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct comment : seq< one<';'>, until< eolf > > {};
struct space_or_comment : sor< space, comment > {};
struct skip : star< space_or_comment > {};
struct gap : plus< blank > {};

struct kw_module : TAO_PEGTL_KEYWORD("module") {};
struct kw_func : TAO_PEGTL_KEYWORD("func") {};
struct kw_end : TAO_PEGTL_KEYWORD("end") {};
struct kw_params : TAO_PEGTL_KEYWORD("params") {};
struct kw_locals : TAO_PEGTL_KEYWORD("locals") {};

struct module_name : identifier {};
struct module_decl : seq< kw_module, gap, must< module_name >, skip > {};

// func NAME [params=N] [locals=M]
struct func_name : identifier {};
struct params_value : plus< digit > {};
struct locals_value : plus< digit > {};
struct params_attr : seq< kw_params, one<'='>, must< params_value > > {};
struct locals_attr : seq< kw_locals, one<'='>, must< locals_value > > {};
struct func_attr : sor< params_attr, locals_attr > {};
struct func_header : seq< kw_func, gap, must< func_name >, star< gap, func_attr >, skip > {};

// mnemonic [operand]
struct mnemonic : seq< identifier_first, star< sor< identifier_other, one<'.'> > > > {};
struct int_operand : seq< opt< one<'-'> >, plus< digit > > {};
struct name_operand : identifier {};
struct operand : sor< int_operand, name_operand > {};
struct instruction : seq< not_at< kw_end >, mnemonic, opt< gap, operand >, skip > {};

struct func_end : seq< kw_end, skip > {};
struct func_decl : seq< func_header, star< instruction >, must< func_end > > {};

struct module_rule : must< skip, opt< module_decl >, star< func_decl >, eof > {};

} // namespace stagec::text::grammar
