#pragma once
#include <string>
#include "../core/types/record.hpp"

namespace Vortex {
namespace Pipeline {

// Receives records one at a time; failures are reported by throwing.
class Sink {
public:
    virtual ~Sink() = default;

    virtual std::string name() const                       = 0;
    virtual void        accept(const Core::Record& record) = 0;
    virtual void        close() {
    }
};

}  // namespace Pipeline
}  // namespace Vortex
