// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_OUTCOME_HPP
#define LINKCHECK_OUTCOME_HPP
#include <string>
#include <variant>

namespace linkcheck {

struct Success{
    unsigned status;
};

struct ClientOrServerError{
    unsigned status;
};

struct TransportError{
    std::string description;
};

using Outcome = std::variant<Success, ClientOrServerError, TransportError>;

Outcome classify(unsigned status);

bool is_broken(const Outcome& outcome);

// Status code as text, or "ERROR" for transport failures.
std::string error_field(const Outcome& outcome);

struct BrokenLink{
    std::string url;
    Outcome outcome;
    std::string source;
};

struct FrontierEntry{
    std::string url;
    unsigned depth;
    std::string source;
};

const char kRootSource[] = "root";

}  // namespace linkcheck
#endif //LINKCHECK_OUTCOME_HPP
