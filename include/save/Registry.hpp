#pragma once

#include "save/Format.hpp"

namespace sw::save {

struct Registry {
    // Rules for `format`. Throws std::logic_error for a value outside the enum.
    static const Format& get(SaveFormat format);
};

}
