#pragma once
#include <string>
#include <string_view>

// replace control and non-ASCII bytes with '.', for echoing user input into messages
std::string filter_unprintable(std::string_view str);
