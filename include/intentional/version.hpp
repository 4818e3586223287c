#ifndef INTENTIONAL_VERSION_HPP
#define INTENTIONAL_VERSION_HPP

#include <string>

namespace intentional {

const std::string INTENTIONAL_VERSION_STRING = "1.4.0";
const int INTENTIONAL_VERSION_MAJOR = 1;
const int INTENTIONAL_VERSION_MINOR = 4;
const int INTENTIONAL_VERSION_PATCH = 0;

// Native messaging host name registered with the browsers
const std::string NATIVE_HOST_NAME = "com.intentional.social";

} // namespace intentional

#endif // INTENTIONAL_VERSION_HPP
