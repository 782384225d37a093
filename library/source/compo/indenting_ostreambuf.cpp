#include "indenting_ostreambuf.hpp"

namespace compo::detail {

indenting_ostreambuf::indenting_ostreambuf(std::ostream& dest,
                                           const options& opts):
    owner_{&dest},
    dest_{dest.rdbuf()},
    indent_(static_cast<std::string::size_type>(opts.indent), ' '),
    at_line_start_{opts.at_line_start}
{
    owner_->rdbuf(this);
}

indenting_ostreambuf::~indenting_ostreambuf()
{
    owner_->rdbuf(dest_);
}

auto indenting_ostreambuf::overflow(int ch) -> int
{
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }
    if (at_line_start_ && (ch != '\n')) {
        dest_->sputn(data(indent_),
                     static_cast<std::streamsize>(size(indent_)));
    }
    at_line_start_ = (ch == '\n');
    return dest_->sputc(traits_type::to_char_type(ch));
}

}
