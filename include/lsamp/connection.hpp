// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief The UDP association with a server.
*/

#ifndef CONNECTION_HPP_g5na0wte
#define CONNECTION_HPP_g5na0wte

#include <lsamp/common.hpp>

#include <string>
#include <vector>

namespace lsamp {
  /*!
  \brief One UDP socket connected to one server.

  The socket is opened on the first send (or an explicit connect()).  At that
  point the host is resolved and replaced by the address it resolved to, which
  is also what goes into the \link prefix() \endlink.

  Every datagram in both directions starts with the prefix:

  - "SAMP"
  - IPv4 address, 4 bytes in network order
  - port, 2 bytes little endian

  Replies are matched to requests by nothing but their leading bytes, so only
  one request may be outstanding at a time.  Use one connection per concurrent
  query.
  */
  class connection {
    std::string host_;
    uint16_t port_;
    int socket_;
    std::string prefix_;
    std::vector<char> buffer_;

    connection(const connection &);
    connection &operator=(const connection &);

    public:
      //! Size of the prefix.
      static const size_t prefix_size = 10;
      //! Enough for any UDP payload.
      static const size_t max_datagram_size = 65536;

      //! Doesn't do any I/O.
      connection(const std::string &host, uint16_t port)
      : host_(host), port_(port), socket_(-1) {}

      ~connection() {
        disconnect();
      }

      /*!
      \brief Resolve the host and connect the socket.  Does nothing if already
             connected.

      \throws connection_error
      */
      void connect() {
        if (connected()) return;

        common::host server(host_, port_);
        const std::string ip = server.ip();
        if (ip != host_) {
          LSAMP_COMMON_DEBUG_MESSAGE(host_ << " resolved to " << ip);
          host_ = ip;
        }

        LSAMP_COMMON_DEBUG_MESSAGE("Initialising socket.");
        int s = ::socket(server.family(), server.type(), server.protocol());
        if (s == -1) {
          common::errno_throw<common::connection_error>("socket() failed");
        }

        LSAMP_COMMON_DEBUG_MESSAGE("Connecting socket.");
        if (::connect(s, server.address(), server.address_len()) == -1) {
          int e = errno;
          ::close(s);
          errno = e;
          common::errno_throw<common::connection_error>("connect() failed");
        }

        socket_ = s;
        prefix_ = make_prefix(server.ipv4(), port_);
        buffer_.resize(max_datagram_size);
        LSAMP_COMMON_DEBUG_MESSAGE("Socket all set up.");
      }

      //! Close the socket.  The next send opens a new one.
      void disconnect() {
        if (socket_ != -1) {
          ::close(socket_);
          socket_ = -1;
        }
      }

      bool connected() const { return socket_ != -1; }

      //! The configured host until connected, then the address it resolved to.
      const std::string &host() const { return host_; }

      uint16_t port() const { return port_; }

      //! Empty until connected.
      const std::string &prefix() const { return prefix_; }

      //! The header of a reply to \c opcode: the prefix then the opcode.
      std::string header(char opcode) {
        connect();
        return prefix_ + opcode;
      }

      //! Necessary to be public for tests, but not the user.
      int socket() const { return socket_; }

      /*!
      \brief Send the prefix, \c opcode and \c payload as one datagram.

      \throws connection_error  if the socket can't be set up or the peer refused.
      \throws send_error
      */
      void send(char opcode, const std::string &payload = std::string()) {
        connect();

        std::string packet(prefix_);
        packet += opcode;
        packet += payload;

        LSAMP_COMMON_DEBUG_MESSAGE("Sending '" << opcode << "' with " << payload.size() << " byte(s) of payload.");
        ssize_t sent = ::send(socket_, packet.data(), packet.size(), 0);
        if (sent == -1) {
          if (errno == ECONNREFUSED) {
            common::errno_throw<common::connection_error>("send() failed");
          }
          common::errno_throw<common::send_error>("send() failed");
        }
        else if (static_cast<size_t>(sent) != packet.size()) {
          throw common::send_error("send() sent a partial datagram");
        }
      }

      /*!
      \brief Block until a datagram starting with \c expected_header arrives.

      Anything else is thrown away; stray and duplicate datagrams are normal.
      There is no timeout.

      \returns The datagram after the header.
      \throws connection_error  if the peer refused.
      \throws recv_error
      */
      std::string receive(const std::string &expected_header) {
        connect();
        std::string body;
        while (! read_matching(expected_header, body)) {}
        return body;
      }

      /*!
      \brief As receive(), but give up at \c deadline.

      \param deadline  a \link common::now() \endlink reading.
      \param body      set to the datagram after the header.
      \returns false if the deadline passed first.
      */
      bool receive(const std::string &expected_header, common::usecs_t deadline, std::string &body) {
        connect();
        while (true) {
          common::usecs_t left = deadline - common::now();
          if (left <= 0) {
            return false;
          }

          if (! common::wait_readable(socket_, left)) continue;

          if (read_matching(expected_header, body)) {
            return true;
          }
        }
      }

    private:
      static std::string make_prefix(struct in_addr address, uint16_t port) {
        std::string p("SAMP");
        p.append(reinterpret_cast<const char *>(&address.s_addr), 4);
        p += static_cast<char>(port & 0xFF);
        p += static_cast<char>((port >> 8) & 0xFF);
        return p;
      }

      //! Read one datagram.  \returns true if it had the header.
      bool read_matching(const std::string &expected_header, std::string &body) {
        ssize_t got = ::recv(socket_, &buffer_[0], buffer_.size(), 0);
        if (got == -1) {
          if (errno == EINTR) return false;
          if (errno == ECONNREFUSED) {
            common::errno_throw<common::connection_error>("recv() failed");
          }
          common::errno_throw<common::recv_error>("recv() failed");
        }

        const size_t size = static_cast<size_t>(got);
        if (size < expected_header.size()
            || memcmp(&buffer_[0], expected_header.data(), expected_header.size()) != 0) {
          LSAMP_COMMON_DEBUG_MESSAGE("Discarding a datagram of " << size << " byte(s) with the wrong header.");
          return false;
        }

        body.assign(&buffer_[0] + expected_header.size(), size - expected_header.size());
        return true;
      }
  };
}

#endif
