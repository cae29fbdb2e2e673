#ifndef UTIL_VERSION_HPP
#define UTIL_VERSION_HPP

#define CODEBOX_VERSION "0.4.1"

#endif
