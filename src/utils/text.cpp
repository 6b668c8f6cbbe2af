/**
 * @file text.cpp
 * @brief Sanitizing of user input before it is echoed into messages.
 */

#include "text.hpp"

std::string filter_unprintable(std::string_view str){
    std::string result;
    result.reserve(str.size());
    for( char c : str ){
        if( c >= 0x20 && c <= 0x7e ){
            result += c;
        } else {
            result += '.';
        }
    }
    return result;
}
