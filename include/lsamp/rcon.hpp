// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief Includes all components for running RCON commands on a server.

See \ref p_RCON "RCON Usage" for usage.
*/

#ifndef RCON_HPP_58dx55q1
#define RCON_HPP_58dx55q1

#include <lsamp/common.hpp>
#include <lsamp/codec.hpp>
#include <lsamp/connection.hpp>
#include <lsamp/encoding.hpp>

#include <string>
#include <vector>

#ifdef LSAMP_RCON_DEBUG_MESSAGES
#  include <iostream>
#  define LSAMP_RCON_DEBUG_MESSAGE(x__)\
   std::cout << __FUNCTION__ << "(): " << x__ << std::endl;
#else
#  define LSAMP_RCON_DEBUG_MESSAGE(x__)
#endif

namespace lsamp {
//! All components of RCON.
namespace rcon {
  //! For interface consistancy we alias these
  //@{
  typedef common::error error;
  typedef common::comm_error comm_error;
  typedef common::bad_password bad_password;
  typedef common::missing_password missing_password;
  typedef common::rcon_disabled rcon_disabled;
  typedef common::connection_error connection_error;
  typedef common::network_error network_error;
  typedef common::proto_error proto_error;
  typedef common::recv_error recv_error;
  typedef common::send_error send_error;
  typedef common::encoding_error encoding_error;
  //@}

  typedef common::usecs_t usecs_t;

  //! The whole of the server's output when the password is wrong.
  const char *const invalid_password_reply = "Invalid RCON password.";

  /*!
  \brief An encoded RCON request.

  Building one does all the checks which don't need the network, so it's done
  before anything is sent.
  */
  class request {
    std::string payload_;

    public:
      /*!
      \param password  UTF-8.
      \param command   UTF-8.

      \throws missing_password  if \c password is empty.
      \throws encoding_error    if either string can't go on the wire.
      */
      request(const std::string &password, const std::string &command) {
        if (password.empty()) {
          throw missing_password("no RCON password was given");
        }

        codec::encoded p = codec::encode(password);
        codec::encoded c = codec::encode(command);
        LSAMP_RCON_DEBUG_MESSAGE("Command '" << command << "' encoded as " << codec::code_page_name(c.code_page));

        codec::packer pk;
        pk.add_string<uint8_t>(p.bytes).add_string<uint8_t>(c.bytes);
        payload_ = pk.data();
      }

      //! Password and command, each behind a 1 byte length.
      const std::string &payload() const { return payload_; }
  };

  /*!
  \brief Run an RCON command and collect the output.

  The output comes as one datagram per line with no numbering, count or end
  marker, so the only way to know it is finished is that nothing more arrives.
  The reply window starts \link common::variance \endlink round trips long and
  each line that arrives pushes the end of the window back by however long
  that line was waited for.  This keeps the window open for as long as the
  server keeps sending at about the same pace.

  There is no early finish: even a one line reply waits out the window.

  \internal

  The nothing-arrived case can't be told apart from RCON being off or the
  server ignoring us, so they are all rcon_disabled.
  */
  class command {
    std::vector<std::string> lines_;

    public:
      static const char opcode = 'x';

      /*!
      \param rtt       a recent ping latency in usecs.
      \param detector  guesses the charset of each line.

      \throws rcon_disabled  if not one line arrived.
      \throws bad_password   if the output was only the invalid password line.
      \throws proto_error    if a reply isn't exactly one line.
      \throws send_error
      \throws recv_error
      \throws connection_error
      */
      command(connection &conn, const request &req, usecs_t rtt, const codec::encoding_detector &detector) {
        LSAMP_RCON_DEBUG_MESSAGE("Sending RCON command, rtt " << rtt << " usecs.");
        conn.send(opcode, req.payload());

        const std::string header = conn.header(opcode);
        usecs_t deadline = common::now() + common::variance * rtt;
        while (true) {
          const usecs_t waiting_since = common::now();
          std::string body;
          if (! conn.receive(header, deadline, body)) {
            break;
          }

          codec::unpacker up(body);
          codec::text line = codec::decode_text(up.get_string<uint8_t>(), detector);
          up.expect_end("RCON reply");
          lines_.push_back(line.value);

          deadline += common::now() - waiting_since;
          LSAMP_RCON_DEBUG_MESSAGE("Line " << lines_.size() << ": '" << line.value << "' (" << line.encoding << ")");
        }

        if (lines_.empty()) {
          throw rcon_disabled("no RCON output was received; RCON is probably disabled");
        }
        else if (data() == invalid_password_reply) {
          throw bad_password("the server rejected the RCON password");
        }
      }

      //! The output lines, in order of arrival.
      const std::vector<std::string> &lines() const { return lines_; }

      //! The output lines joined with newlines.
      std::string data() const {
        std::string d;
        for (size_t i = 0; i < lines_.size(); ++i) {
          if (i != 0) d += '\n';
          d += lines_[i];
        }
        return d;
      }
  };
}
}

#endif // RCON_HPP_58dx55q1
