#pragma once

#include "boost/system/error_category.hpp"

#include "ytassist.pb.h"


namespace boost::system {

template <>
struct is_error_code_enum<ytassist::pb::Error> : std::true_type {};

} // ns

namespace ytassist {

class ErrorCategory : public boost::system::error_category {
    const char *name() const noexcept override {
        return "ytassist";
    }

    std::string message(int ev) const override;
};

/*! Map an error to the HTTP status code used in replies */
int toHttpStatus(pb::Error error) noexcept;

/*! The reason phrase for the HTTP status codes we use */
std::string_view httpReason(int status) noexcept;

} // ns

boost::system::error_code make_error_code(const ytassist::pb::Error& e) noexcept;
