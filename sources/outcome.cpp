// Copyright 2018 Your Name <your_email>

#include <outcome.hpp>

namespace linkcheck {

Outcome classify(unsigned status) {
    if (status >= 400) return ClientOrServerError{status};
    return Success{status};
}

bool is_broken(const Outcome& outcome) {
    return !std::holds_alternative<Success>(outcome);
}

std::string error_field(const Outcome& outcome) {
    if (auto error = std::get_if<ClientOrServerError>(&outcome))
        return std::to_string(error->status);
    if (auto success = std::get_if<Success>(&outcome))
        return std::to_string(success->status);
    return "ERROR";
}

}  // namespace linkcheck
