#include "./params.hpp"

#include <iterator>

std::string tint::to_string(const param_list& params) {
    std::string ret;
    write_escape(params, std::back_inserter(ret));
    return ret;
}
