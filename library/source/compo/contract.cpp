#include "compo/contract.hpp"

namespace compo {

auto operator<<(std::ostream& os, const data_field& value) -> std::ostream&
{
    os << "data_field{";
    os << ".name=" << value.name;
    os << ",.type=" << value.type;
    os << "}";
    return os;
}

auto operator<<(std::ostream& os, const contract& value) -> std::ostream&
{
    os << "contract{";
    os << ".name=" << value.name;
    os << ",.kind=" << value.kind;
    if (!empty(value.endpoints)) {
        os << ",.endpoints={";
        auto prefix = "";
        for (auto&& name: value.endpoints) {
            os << prefix << name;
            prefix = ",";
        }
        os << "}";
    }
    if (!empty(value.fields)) {
        os << ",.fields={";
        auto prefix = "";
        for (auto&& field: value.fields) {
            os << prefix << field;
            prefix = ",";
        }
        os << "}";
    }
    os << "}";
    return os;
}

}
