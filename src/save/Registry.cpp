#include "save/Registry.hpp"
#include "save/formats/Everdrive.hpp"
#include "save/formats/Mupen64Plus.hpp"
#include "save/formats/Project64.hpp"

#include <stdexcept>
#include <string>

using namespace sw::save;

const Format& Registry::get(const SaveFormat format) {
    static const formats::Project64 project64{};
    static const formats::Mupen64Plus mupen64plus{};
    static const formats::Everdrive everdrive{};

    switch (format) {
        case SaveFormat::Project64: return project64;
        case SaveFormat::Mupen64Plus: return mupen64plus;
        case SaveFormat::Everdrive: return everdrive;
    }
    throw std::logic_error("No rules registered for save format " + std::to_string(static_cast<int>(format)));
}
