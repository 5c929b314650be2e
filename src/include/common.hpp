#ifndef ETAGCACHE_COMMON_HPP
#define ETAGCACHE_COMMON_HPP

// Standard C++ headers
#include <algorithm>          // efficient algorithms
#include <array>              // fixed-size arrays
#include <atomic>             // atomic operations
#include <cctype>             // tolower for case-insensitive header names
#include <chrono>             // measuring time
#include <condition_variable> // blocking thread synchronization
#include <cstdint>            // fixed-width integer types
#include <cstdlib>            // EXIT_SUCCESS, EXIT_FAILURE
#include <deque>              // double-ended queue
#include <filesystem>         // filesystem operations
#include <fstream>            // file reading operations
#include <functional>         // function objects
#include <iomanip>            // stream formatting
#include <iostream>           // std::cout, std::cerr - for console output
#include <limits>             // numeric limits
#include <list>               // doubly linked list for cache implementation
#include <map>                // ordered associative container (Red-Black Tree)
#include <memory>             // smart pointers
#include <memory_resource>    // memory resource management
#include <mutex>              // thread synchronization
#include <optional>           // optional type
#include <sstream>            // string stream manipulations
#include <stdexcept>          // standard exceptions like std::runtime_error
#include <string>             // owning strings
#include <string_view>        // efficient string handling without ownership
#include <thread>             // multithreading support
#include <unordered_map>      // unordered associative container (Hash Table)
#include <utility>            // std::move, std::pair
#include <vector>             // dynamic array

// System headers
#include <arpa/inet.h>   // inet_ntop - for converting IP addresses
#include <csignal>       // signal handling
#include <cstring>       // strerror() - for error messages
#include <ctime>         // handling timestamps
#include <fcntl.h>       // file control options
#include <netdb.h>       // getaddrinfo - host name resolution
#include <netinet/in.h>  // sockaddr_in - structure for IPv4 addresses
#include <netinet/tcp.h> // TCP_NODELAY
#include <poll.h>        // poll - for connect timeout
#include <sys/socket.h>  // socket(), connect(), send(), recv() - for socket operations
#include <unistd.h>      // close() function - to close file descriptors

// Third-party headers
#include <nlohmann/json.hpp> // JSON parsing
#include <openssl/err.h>     // OpenSSL error queue
#include <openssl/evp.h>     // EVP digests
#include <openssl/ssl.h>     // TLS client connections
#include <zlib.h>            // zlib decompression

namespace fs = std::filesystem; // Alias for filesystem namespace
using json = nlohmann::json;    // Alias for JSON namespace

#endif // ETAGCACHE_COMMON_HPP
