#pragma once

#include <string>
#include <string_view>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>


namespace enginewire::core::protocol::base64 {

// Standard alphabet, '=' padded
[[nodiscard]]
inline std::string encode(std::string_view in) {
    using namespace boost::archive::iterators;
    using It = base64_from_binary<transform_width<std::string_view::const_iterator, 6, 8>>;

    std::string out(It(in.begin()), It(in.end()));
    out.append((3 - in.size() % 3) % 3, '=');
    return out;
}

// Returns false on malformed input (bad length, bad character, misplaced '=')
[[nodiscard]]
inline bool decode(std::string_view in, std::string& out) {
    using namespace boost::archive::iterators;
    using It = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

    out.clear();
    if (in.empty()) {
        return true;
    }
    if (in.size() % 4 != 0) {
        return false;
    }
    std::size_t pad = 0;
    while (pad < 2 && in[in.size() - 1 - pad] == '=') {
        ++pad;
    }
    if (in.substr(0, in.size() - pad).find('=') != std::string_view::npos) {
        return false;
    }
    // padding decodes as zero bits, trimmed below
    std::string src(in);
    src.replace(src.size() - pad, pad, pad, 'A');
    try {
        out.assign(It(src.cbegin()), It(src.cend()));
    } catch (const dataflow_exception&) {
        out.clear();
        return false;
    }
    out.resize(out.size() - pad);
    return true;
}

} // namespace enginewire::core::protocol::base64
