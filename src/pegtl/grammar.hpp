#pragma once
#include <tao/pegtl.hpp>

namespace zerg::pegtl_front::grammar {
using namespace tao::pegtl;

// Stage-1 segmentation. One successful match of `segment` yields exactly one
// coarse token; together the alternatives cover every byte, so the input is
// always consumed in full.
struct newline : one<'\n'> {};
struct comment : seq< two<'/'>, star< not_one<'\n'> > > {};
struct space_run : plus< one<' ', '\t'> > {};
// No escapes; an unterminated string swallows the rest of the input.
struct string_lit : seq< one<'"'>, star< not_one<'"'> >, opt< one<'"'> > > {};
struct unknown_run : plus< not_one<' ', '\t', '\n'> > {};

struct segment : sor< newline, comment, space_run, string_lit, unknown_run > {};

} // namespace zerg::pegtl_front::grammar
