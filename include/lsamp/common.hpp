// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief Containing the entire \link lsamp::common \endlink namespace.
*/

#ifndef COMMON_HPP_q7w2mzc4
#define COMMON_HPP_q7w2mzc4

#include <sys/types.h>
#include <sys/socket.h>
#include <poll.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <time.h>
#include <stdint.h>
#include <endian.h>

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>

#include <random>
#include <stdexcept>
#include <string>


#if defined(LSAMP_COMMON_DEBUG_MESSAGES) || defined(LSAMP_RCON_DEBUG_MESSAGES) \
    || defined(LSAMP_QUERY_DEBUG_MESSAGES)
#  include <iostream>
#  define LSAMP_DEBUG_MESSAGE(x__)\
   std::cout << __FUNCTION__ << "(): " << x__ << std::endl;
#else
#  define LSAMP_DEBUG_MESSAGE(x__)
#endif

#if defined(LSAMP_COMMON_DEBUG_MESSAGES)
#  define LSAMP_COMMON_DEBUG_MESSAGE(x__) LSAMP_DEBUG_MESSAGE(x__)
#else
#  define LSAMP_COMMON_DEBUG_MESSAGE(x__)
#endif

/*!
\def LSAMP_SYS_LITTLE_ENDIAN

Readability variable for endianness feature test.  When it is not defined, the
byte order is swapped transparently.
*/

#ifndef __BYTE_ORDER
#  warning: assuming little endian byte order because __BYTE_ORDER does not exist.
#  define LSAMP_SYS_LITTLE_ENDIAN
#elif __BYTE_ORDER == __LITTLE_ENDIAN
#  define LSAMP_SYS_LITTLE_ENDIAN
#elif __BYTE_ORDER == __BIG_ENDIAN
#  define LSAMP_SYS_BIG_ENDIAN
#else
#  warning: assuming little endian byte order because __BYTE_ORDER is defined to something unknown.
#  define LSAMP_SYS_LITTLE_ENDIAN
#endif

//! Everything in the library.
namespace lsamp {

/*!
\brief This is only used internally, but some docs are relevant.

Components which are not specific to a particular part of the lib.
*/
namespace common {
  //! Catch-all error class.
  struct error : public std::runtime_error {
    error(const std::string &s) : std::runtime_error(s) {}
    ~error() throw() {}
  };

  //! Network error, indicating some kind of failure.
  struct network_error : public error {
    network_error(const std::string &s) : error(s) {}
    ~network_error() throw() {}
  };

  //! General communications errors which might be recoverable.
  struct comm_error : public error {
    comm_error(const std::string &s) : error(s) {}
    ~comm_error() throw() {}
  };

  //! A failure to resolve, socket(), connect() etc.  Also a refused peer.
  struct connection_error : public comm_error {
    connection_error(const std::string &s) : comm_error(s) {}
    ~connection_error() throw() {}
  };

  //! The server rejected the RCON password.
  struct bad_password : public comm_error {
    bad_password(const std::string &s) : comm_error(s) {}
    ~bad_password() throw() {}
  };

  /*!
  \brief No RCON output arrived inside the reply window.

  RCON being turned off, an unreachable RCON endpoint and a command with no
  output all look like this; the protocol can't tell them apart.
  */
  struct rcon_disabled : public comm_error {
    rcon_disabled(const std::string &s) : comm_error(s) {}
    ~rcon_disabled() throw() {}
  };

  //! A timeout set by the user ran out.
  struct timeout_error : public comm_error {
    timeout_error(const std::string &s) : comm_error(s) {}
    ~timeout_error() throw() {}
  };

  //! RCON was used but no password was configured.
  struct missing_password : public error {
    missing_password(const std::string &s) : error(s) {}
    ~missing_password() throw() {}
  };

  //! Text could not be converted to or from the wire.
  struct encoding_error : public error {
    encoding_error(const std::string &s) : error(s) {}
    ~encoding_error() throw() {}
  };

  //! Sending data failed.
  struct send_error : public network_error {
    send_error(const std::string &s) : network_error(s) {}
    ~send_error() throw() {}
  };

  //! Reading data failed.
  struct recv_error : public network_error {
    recv_error(const std::string &s) : network_error(s) {}
    ~recv_error() throw() {}
  };

  //! Caused by some violation of the protocol, eg. a datagram with bytes left over.
  struct proto_error : public network_error {
    proto_error(const std::string &s) : network_error(s) {}
    ~proto_error() throw() {}
  };

  //! Throw given exception using errno to get a message
  template <typename Exception>
  void errno_throw(const char *message) {
    std::string m(message);
    m += ": ";
    m += strerror(errno);
    throw Exception(m);
  }

  //! Microseconds.  All latencies, timeouts and deadlines use this.
  typedef int64_t usecs_t;

  /*!
  \brief Upper bound on the ratio of the slowest to the fastest round trip on a
         healthy link.

  Reply windows which are derived from a ping are this many pings long.
  */
  const int variance = 5;

  //! Monotonic clock reading; only differences between readings mean anything.
  inline usecs_t now() {
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) == -1) {
      errno_throw<error>("clock_gettime() failed");
    }
    return static_cast<usecs_t>(ts.tv_sec) * 1000000 + ts.tv_nsec / 1000;
  }

  //! Random value for matching a reply to its request.  Safe to call from many threads.
  inline uint32_t random_nonce() {
    static thread_local std::random_device device;
    return static_cast<uint32_t>(device());
  }

  /*!
  \brief Take care of DNS.

  Only IPv4 UDP addresses are looked up; the protocol puts the address in every
  packet and has no room for anything else.
  */
  class host {
    struct addrinfo *ad_info;

    host(const host &);
    host &operator=(const host &);

    public:
      host(const std::string &name, uint16_t port) {
        LSAMP_COMMON_DEBUG_MESSAGE("Host is: " << name << ":" << port);

        if (name.empty()) throw std::invalid_argument("host must not be empty");

        struct addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        hints.ai_protocol = IPPROTO_UDP;
        hints.ai_flags = AI_NUMERICSERV;

        char service[8];
        snprintf(service, sizeof(service), "%u", static_cast<unsigned>(port));

        LSAMP_COMMON_DEBUG_MESSAGE("Getting address info.");
        int r;
        if ((r = getaddrinfo(name.c_str(), service, &hints, &ad_info)) != 0) {
          throw connection_error(std::string("getaddrinfo() failed: ") + gai_strerror(r));
        }

        if (ad_info->ai_addr == NULL || ad_info->ai_addrlen < sizeof(struct sockaddr_in)) {
          freeaddrinfo(ad_info);
          throw connection_error("No socket address returned.");
        }
#if defined(LSAMP_COMMON_DEBUG_MESSAGES)
        else if (ad_info->ai_next != NULL) {
          LSAMP_COMMON_DEBUG_MESSAGE("Warning: more than one socket address was returned "
                                     "from gettaddrinfo().  The first one is used.");
        }
#endif
      }

      ~host() {
        freeaddrinfo(ad_info);
      }

      //! ai_family for a socket() call.
      int family() const { return ad_info->ai_family; }

      //! SOCK_DGRAM.  For socket()
      int type() const { return ad_info->ai_socktype; }

      //! IPPROTO_UDP.  For socket()
      int protocol() const { return ad_info->ai_protocol; }

      //! Address struct for a connect() call.
      const struct sockaddr *address() const { return ad_info->ai_addr; }

      //! Length value for a connect() call.
      socklen_t address_len() const { return ad_info->ai_addrlen; }

      //! The resolved address in network order.
      struct in_addr ipv4() const {
        return reinterpret_cast<const struct sockaddr_in *>(ad_info->ai_addr)->sin_addr;
      }

      //! The resolved address as a dotted quad.
      std::string ip() const {
        struct in_addr a = ipv4();
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &a, buf, sizeof(buf)) == NULL) {
          errno_throw<connection_error>("inet_ntop() failed");
        }
        return buf;
      }
  };

  /*!
  \brief Wait for the socket to become readable.

  Uses poll() so that descriptors past FD_SETSIZE work.  The timeout is rounded
  up to whole milliseconds.

  \returns false if \c timeout_usecs ran out or the wait was interrupted by a
           signal; callers re-check their deadline and wait again.
  */
  inline bool wait_readable(int socket_fd, usecs_t timeout_usecs) {
    if (timeout_usecs < 0) timeout_usecs = 0;

    struct pollfd p;
    p.fd = socket_fd;
    p.events = POLLIN;
    p.revents = 0;

    usecs_t ms = (timeout_usecs + 999) / 1000;
    if (ms > INT_MAX) ms = INT_MAX;

    int ret = poll(&p, 1, static_cast<int>(ms));
    if (ret == -1) {
      if (errno == EINTR) return false;
      errno_throw<recv_error>("poll() failed");
    }

    return ret > 0 && (p.revents & (POLLIN | POLLERR)) != 0;
  }
}
}

#endif
