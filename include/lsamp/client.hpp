// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief One object for everything you can ask a server.
*/

#ifndef CLIENT_HPP_k2p8vexl
#define CLIENT_HPP_k2p8vexl

#include <lsamp/common.hpp>
#include <lsamp/connection.hpp>
#include <lsamp/encoding.hpp>
#include <lsamp/query.hpp>
#include <lsamp/rcon.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

namespace lsamp {
  /*!
  \brief A server with a host, a port and maybe an RCON password.

  Owns one \link connection \endlink, so one call at a time.  Make another
  client for the same server to query it concurrently.

  ping(), info(), players() and rules() wait forever for their reply unless a
  \link timeout() \endlink is set.  is_omp() and rcon() have their own windows
  worked out from the ping.
  */
  class client {
    connection conn_;
    std::string rcon_password_;
    codec::icu_detector default_detector_;
    const codec::encoding_detector *detector_;
    common::usecs_t timeout_;

    client(const client &);
    client &operator=(const client &);

    public:
      //! \param rcon_password  empty means there is none.  Doesn't do any I/O.
      client(const std::string &host, uint16_t port, const std::string &rcon_password = std::string())
      : conn_(host, port), rcon_password_(rcon_password), detector_(&default_detector_), timeout_(0) {}

      //! The configured host until connected, then the address it resolved to.
      const std::string &host() const { return conn_.host(); }

      uint16_t port() const { return conn_.port(); }

      /*!
      \brief The resolved endpoint as "a.b.c.d:port".

      Resolves the host first if that hasn't happened yet.

      \throws connection_error
      */
      std::string address() {
        conn_.connect();
        std::ostringstream ss;
        ss << conn_.host() << ":" << conn_.port();
        return ss.str();
      }

      //! Timeout for ping(), info(), players() and rules() in usecs.  0 is forever.
      void timeout(common::usecs_t t) {
        if (t < 0) throw std::invalid_argument("timeout must not be negative");
        timeout_ = t;
      }

      common::usecs_t timeout() const { return timeout_; }

      //! Replace charset detection.  \c d must outlive the client.
      void detector(const codec::encoding_detector &d) { detector_ = &d; }

      //! Close the socket; the next call opens a new one.
      void disconnect() { conn_.disconnect(); }

      //! The underlying connection.
      connection &conn() { return conn_; }

      //! Round trip time in usecs.
      common::usecs_t ping() {
        return query::ping(conn_, timeout_).latency();
      }

      query::server_info info() {
        return query::info(conn_, *detector_, timeout_).data();
      }

      query::player_list players() {
        return query::players(conn_, timeout_).data();
      }

      query::rule_list rules() {
        return query::rules(conn_, *detector_, timeout_).data();
      }

      //! Pings, then waits a few pings for an open.mp only reply.
      bool is_omp() {
        common::usecs_t rtt = ping();
        return query::omp_probe(conn_, rtt).is_omp();
      }

      /*!
      \brief Run \c command and return its output lines joined by newlines.

      \throws missing_password  before any I/O if there is no password.
      \throws encoding_error    before any I/O.
      \throws rcon_disabled
      \throws bad_password
      */
      std::string rcon(const std::string &command) {
        lsamp::rcon::request req(rcon_password_, command);
        common::usecs_t rtt = ping();
        return lsamp::rcon::command(conn_, req, rtt, *detector_).data();
      }
  };
}

#endif
