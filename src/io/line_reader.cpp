#include "io/line_reader.hpp"

namespace hhrkit {

bool LineReader::next(std::string& line) {
    if (!std::getline(in_, line)) return false;
    line_number_++;
    // Remove trailing \r if present (Windows line endings)
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

} // namespace hhrkit
