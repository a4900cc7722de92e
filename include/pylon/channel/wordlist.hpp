#pragma once

#include <span>
#include <string_view>

namespace pylon::channel
{

// Words a generated wormhole code is built from. All lower case, no dashes.
std::span<const std::string_view> code_words();

bool is_code_word(std::string_view word);

}  // namespace pylon::channel
