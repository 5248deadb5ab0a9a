#pragma once
#include <tao/pegtl.hpp>

namespace spice { namespace grammar {
using namespace tao::pegtl;

// A normalized line: single spaces between tokens, no comments, no tabs.
struct blank : one<' '> {};
struct sep   : star< blank > {};
struct seps  : plus< blank > {};
struct word  : plus< not_one<' '> > {};
struct word_end : not_at< not_one<' '> > {};

// Keywords
struct kw_subckt : seq< TAO_PEGTL_ISTRING(".subckt"), word_end > {};

// .subckt <name> <ports/params...>
struct subckt_name : word {};
struct subckt_head : seq< kw_subckt, seps, subckt_name > {};

struct instance_tok : word {};
struct field_tok    : word {};
struct field_list   : star< seps, field_tok > {};

struct statement : seq< sep, sor< subckt_head, instance_tok >, field_list, sep, eof > {};

// One argument token: key[=value]
struct arg_key   : star< not_one<'='> > {};
struct arg_value : star< any > {};
struct argument  : seq< arg_key, opt< one<'='>, arg_value >, eof > {};

}} // namespace spice::grammar
