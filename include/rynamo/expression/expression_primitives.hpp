#pragma once

#include <tao/pegtl.hpp>

namespace rynamo::expression::rules {

namespace pegtl = tao::pegtl;

struct optional_space : pegtl::star<pegtl::space> {
};

// Case-insensitive reserved word that must not run into a following identifier character.
template <char... Cs>
struct keyword : pegtl::seq<pegtl::istring<Cs...>, pegtl::not_at<pegtl::identifier_other>> {
};

// Function names are case-sensitive in expressions.
template <char... Cs>
struct function_keyword : pegtl::seq<pegtl::string<Cs...>, pegtl::not_at<pegtl::identifier_other>> {
};

struct kw_and : keyword<'A', 'N', 'D'> {
};

struct kw_between : keyword<'B', 'E', 'T', 'W', 'E', 'E', 'N'> {
};

struct string_literal_char : pegtl::sor<pegtl::seq<pegtl::one<'\''>, pegtl::one<'\''>>, pegtl::not_one<'\''>> {
};

struct name_placeholder : pegtl::seq<pegtl::one<'#'>, pegtl::plus<pegtl::identifier_other>> {
};

struct value_placeholder : pegtl::seq<pegtl::one<':'>, pegtl::plus<pegtl::identifier_other>> {
};

struct attribute_name : pegtl::identifier {
};

struct name_segment : pegtl::sor<name_placeholder, attribute_name> {
};

struct index_digits : pegtl::plus<pegtl::digit> {
};

struct list_index : pegtl::seq<pegtl::one<'['>, pegtl::must<index_digits>, pegtl::must<pegtl::one<']'>>> {
};

struct dotted_segment : pegtl::seq<pegtl::one<'.'>, pegtl::must<name_segment>> {
};

struct path : pegtl::seq<name_segment, pegtl::star<pegtl::sor<dotted_segment, list_index>>> {
};

struct op_not_equal : pegtl::string<'<', '>'> {
};

struct op_less_equal : pegtl::string<'<', '='> {
};

struct op_greater_equal : pegtl::string<'>', '='> {
};

struct op_less : pegtl::one<'<'> {
};

struct op_greater : pegtl::one<'>'> {
};

struct op_equal : pegtl::one<'='> {
};

struct comparator : pegtl::sor<op_not_equal, op_less_equal, op_greater_equal, op_less, op_greater, op_equal> {
};

}  // namespace rynamo::expression::rules
