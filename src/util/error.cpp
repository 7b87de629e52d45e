#include <ulid/error.hpp>

namespace ulid {

const char* UlidError::code_name(Code c) {
    switch (c) {
        case Range:    return "Range";
        case Length:   return "Length";
        case Format:   return "Format";
        case Overflow: return "Overflow";
        case Entropy:  return "Entropy";
        case IO:       return "IO";
        case Parse:    return "Parse";
        case Config:   return "Config";
    }
    return "Unknown";
}

std::string UlidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace ulid
