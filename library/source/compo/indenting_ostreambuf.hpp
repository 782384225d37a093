#ifndef indenting_ostreambuf_hpp
#define indenting_ostreambuf_hpp

#include <ostream>
#include <streambuf>
#include <string>

namespace compo::detail {

struct indenting_ostreambuf_options {
    static constexpr auto default_indent = 2;

    int indent{default_indent};
    bool at_line_start{true};
};

/// @brief Stream buffer that indents every line written through it.
/// @details While an instance constructed from a <code>std::ostream</code>
///   exists, output to that stream is forwarded to the stream's original
///   buffer with the indent inserted at the start of every non-empty line.
///   The original buffer is restored on destruction so these nest.
struct indenting_ostreambuf: public std::streambuf
{
    using options = indenting_ostreambuf_options;

    explicit indenting_ostreambuf(std::ostream& dest,
                                  const options& opts = options());
    ~indenting_ostreambuf() override;

    indenting_ostreambuf(const indenting_ostreambuf&) = delete;
    auto operator=(const indenting_ostreambuf&)
        -> indenting_ostreambuf& = delete;

private:
    std::ostream* owner_{};
    std::streambuf* dest_{};
    std::string indent_;
    bool at_line_start_{true};

    auto overflow(int ch) -> int override;
};

}

#endif /* indenting_ostreambuf_hpp */
