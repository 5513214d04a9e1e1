#pragma once

#include <string>
#include <cctype>

namespace uppy {

enum class DeletionChoice {
    YES,
    NO,
    INVALID,
};


inline const char* to_string(DeletionChoice choice) {
    switch(choice) {
        case DeletionChoice::YES: return "YES";
        case DeletionChoice::NO: return "NO";
        case DeletionChoice::INVALID: return "INVALID";
        default: return "UNKNOWN";
    }
}


// One line of user input, whitespace and case ignored. Anything unrecognised is INVALID.
inline DeletionChoice from_string(const std::string& answer) {
    size_t a = 0, b = answer.size();
    while (a < b && std::isspace(static_cast<unsigned char>(answer[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(answer[b - 1]))) --b;

    std::string normalized = answer.substr(a, b - a);
    for (char& c : normalized) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (normalized == "yes" || normalized == "y") return DeletionChoice::YES;
    else if (normalized == "no" || normalized == "n") return DeletionChoice::NO;
    else return DeletionChoice::INVALID;
}

} // namespace uppy
