#pragma once

#include <boost/beast/http.hpp>

using Request = boost::beast::http::request<boost::beast::http::string_body>;
