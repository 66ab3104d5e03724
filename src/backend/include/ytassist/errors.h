#pragma once

#include <string>
#include <optional>
#include <stdexcept>
#include "ytassist.pb.h"

namespace ytassist {

/*! A recognized, typed failure from the service layer.
 *
 *  The error code decides the HTTP status in the reply.
 *  Validation errors may name the offending field.
 */
struct server_err : public std::runtime_error {

    server_err(pb::Error error, std::string message) noexcept
        :  std::runtime_error{std::move(message)}, error_{error} {}

    server_err(pb::Error error, std::string message, std::string field) noexcept
        :  std::runtime_error{std::move(message)}, error_{error}, field_{std::move(field)} {}

    pb::Error error() const noexcept {
        return error_;
    }

    const std::optional<std::string>& field() const noexcept {
        return field_;
    }

 private:
    pb::Error error_;
    std::optional<std::string> field_;
};


} //ns
