#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace context
{

// One (type, value) pair reported by the language model. type_label is the
// model's own Japanese category name, e.g. "個人名".
struct ContextFinding
{
    std::string type_label;
    std::string value;
};

// Raised by clients on transport, HTTP status or response-format failures
class ContextError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class IContextClient
{
public:
    virtual ~IContextClient() = default;

    virtual const char* clientName() const = 0;

    // Cheap reachability probe
    virtual bool isAvailable() const = 0;

    // Throws ContextError on failure
    virtual std::vector<ContextFinding> analyze(const std::string& text) const = 0;
};

} // namespace context
