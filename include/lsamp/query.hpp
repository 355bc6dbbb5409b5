// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief The public query interface to a server.

Each query is an object which does its whole exchange in the constructor and
then holds the result.  See \ref p_query "Query Usage".
*/

#ifndef QUERY_HPP_ifzth5xs
#define QUERY_HPP_ifzth5xs

#include <lsamp/common.hpp>
#include <lsamp/codec.hpp>
#include <lsamp/connection.hpp>
#include <lsamp/encoding.hpp>

#include <string>
#include <vector>

#ifdef LSAMP_QUERY_DEBUG_MESSAGES
#  include <iostream>
#  define LSAMP_QUERY_DEBUG_MESSAGE(x__)\
   std::cout << __FUNCTION__ << "(): " << x__ << std::endl;
#else
#  define LSAMP_QUERY_DEBUG_MESSAGE(x__)
#endif

namespace lsamp {
//! For querying the public properties of servers.
namespace query {
  //! For interface consistancy we alias these
  //@{
  typedef common::error error;
  typedef common::comm_error comm_error;
  typedef common::connection_error connection_error;
  typedef common::timeout_error timeout_error;
  typedef common::network_error network_error;
  typedef common::proto_error proto_error;
  typedef common::recv_error recv_error;
  typedef common::send_error send_error;
  typedef common::encoding_error encoding_error;
  //@}

  typedef common::usecs_t usecs_t;

  //! The reply to an info query.
  struct server_info {
    bool password;
    uint16_t players;
    uint16_t max_players;
    std::string name;
    std::string gamemode;
    std::string language;
    //! What each text field was decoded as.
    //@{
    std::string name_encoding;
    std::string gamemode_encoding;
    std::string language_encoding;
    //@}

    server_info() : password(false), players(0), max_players(0) {}
  };

  //! One entry of a players reply.
  struct player {
    //! 7-bit.
    std::string name;
    int32_t score;

    player() : score(0) {}
  };

  typedef std::vector<player> player_list;

  //! One entry of a rules reply.
  struct rule {
    //! 7-bit.
    std::string name;
    std::string value;
    //! What the value was decoded as.
    std::string encoding;
  };

  typedef std::vector<rule> rule_list;

  inline bool operator==(const server_info &a, const server_info &b) {
    return a.password == b.password && a.players == b.players
        && a.max_players == b.max_players && a.name == b.name
        && a.gamemode == b.gamemode && a.language == b.language
        && a.name_encoding == b.name_encoding
        && a.gamemode_encoding == b.gamemode_encoding
        && a.language_encoding == b.language_encoding;
  }

  inline bool operator==(const player &a, const player &b) {
    return a.name == b.name && a.score == b.score;
  }

  inline bool operator==(const rule &a, const rule &b) {
    return a.name == b.name && a.value == b.value && a.encoding == b.encoding;
  }

  //! Non-instanciable base class for request types.
  class query_base {
    protected:
      static const char op_ping = 'p';
      static const char op_info = 'i';
      static const char op_players = 'c';
      static const char op_rules = 'r';
      static const char op_omp = 'o';

      //! 4 random bytes.
      static std::string make_nonce() {
        codec::packer p;
        p.add<uint32_t>(common::random_nonce());
        return p.data();
      }

      //! A deadline \c timeout from now, or 0 for none.
      static usecs_t deadline_after(usecs_t timeout) {
        return (timeout > 0) ? common::now() + timeout : 0;
      }

      /*!
      \brief Wait for the reply with \c header.

      \param deadline  0 to wait forever.
      \throws timeout_error  if the deadline passed.
      */
      static std::string reply(connection &conn, const std::string &header, usecs_t deadline) {
        if (deadline == 0) {
          return conn.receive(header);
        }

        std::string body;
        if (! conn.receive(header, deadline, body)) {
          throw timeout_error("timed out waiting for a reply");
        }
        return body;
      }
  };


  /*!
  \brief A ping command to measure latency.

  A random nonce goes out with the request and must come back unchanged with
  nothing after it; any other reply is ignored.
  */
  class ping : public query_base {
    usecs_t latency_;

    public:
      /*!
      \param timeout  in usecs; 0 waits forever.

      \throws connection_error
      \throws send_error
      \throws recv_error
      \throws timeout_error
      */
      explicit ping(connection &conn, usecs_t timeout = 0) : latency_(0) {
        const std::string nonce = make_nonce();
        const usecs_t start = common::now();
        const usecs_t deadline = deadline_after(timeout);

        LSAMP_QUERY_DEBUG_MESSAGE("Sending ping packet.");
        conn.send(op_ping, nonce);

        const std::string header = conn.header(op_ping) + nonce;
        while (true) {
          std::string body = reply(conn, header, deadline);
          if (body.empty()) break;
          LSAMP_QUERY_DEBUG_MESSAGE("Ignoring a ping reply with " << body.size() << " trailing byte(s).");
        }

        latency_ = common::now() - start;
        LSAMP_QUERY_DEBUG_MESSAGE("Latency is: " << latency_);
      }

      //! Round trip time in usecs.
      usecs_t latency() const { return latency_; }
  };


  //! \brief Query for server name, num players etc.
  class info : public query_base {
    server_info data_;

    public:
      /*!
      \param detector  guesses the charset of the text fields.
      \param timeout   in usecs; 0 waits forever.

      \throws proto_error  if the reply isn't exactly one info record.
      \throws timeout_error
      \throws encoding_error
      */
      info(connection &conn, const codec::encoding_detector &detector, usecs_t timeout = 0) {
        const usecs_t deadline = deadline_after(timeout);
        LSAMP_QUERY_DEBUG_MESSAGE("Sending info packet.");
        conn.send(op_info);
        data_ = parse(reply(conn, conn.header(op_info), deadline), detector);
      }

      const server_info &data() const { return data_; }

      /*!
      \brief Decode an info reply body.

      Layout: bool password, uint16 players, uint16 max players, then name,
      gamemode and language as strings with 4 byte lengths.

      \throws proto_error
      \throws encoding_error
      */
      static server_info parse(const std::string &body, const codec::encoding_detector &detector) {
        codec::unpacker up(body);
        server_info i;
        i.password = up.get_bool();
        i.players = up.get<uint16_t>();
        i.max_players = up.get<uint16_t>();

        codec::text t = codec::decode_text(up.get_string<uint32_t>(), detector);
        i.name = t.value;
        i.name_encoding = t.encoding;

        t = codec::decode_text(up.get_string<uint32_t>(), detector);
        i.gamemode = t.value;
        i.gamemode_encoding = t.encoding;

        t = codec::decode_text(up.get_string<uint32_t>(), detector);
        i.language = t.value;
        i.language_encoding = t.encoding;

        up.expect_end("info reply");

        LSAMP_QUERY_DEBUG_MESSAGE("Properties of info:");
        LSAMP_QUERY_DEBUG_MESSAGE("  name: " << i.name << " (" << i.name_encoding << ")");
        LSAMP_QUERY_DEBUG_MESSAGE("  gamemode: " << i.gamemode << " (" << i.gamemode_encoding << ")");
        LSAMP_QUERY_DEBUG_MESSAGE("  language: " << i.language << " (" << i.language_encoding << ")");
        LSAMP_QUERY_DEBUG_MESSAGE("  players: " << i.players << "/" << i.max_players);
        LSAMP_QUERY_DEBUG_MESSAGE("  passworded: " << (int) i.password);
        return i;
      }
  };


  /*!
  \brief List of players on the server.

  \note Servers stop answering this once there are more than about 100 players,
        so a timeout is a good idea.
  */
  class players : public query_base {
    player_list data_;

    public:
      //! \param timeout  in usecs; 0 waits forever.
      explicit players(connection &conn, usecs_t timeout = 0) {
        const usecs_t deadline = deadline_after(timeout);
        LSAMP_QUERY_DEBUG_MESSAGE("Sending players request.");
        conn.send(op_players);
        data_ = parse(reply(conn, conn.header(op_players), deadline));
      }

      const player_list &data() const { return data_; }

      /*!
      Layout: uint16 count, then for each player a name with a 1 byte length and
      an int32 score.

      \throws proto_error
      */
      static player_list parse(const std::string &body) {
        codec::unpacker up(body);
        uint16_t count = up.get<uint16_t>();
        LSAMP_QUERY_DEBUG_MESSAGE("  num players: " << count);

        player_list list;
        list.reserve(count);
        for (uint16_t n = 0; n < count; ++n) {
          player p;
          p.name = codec::decode(up.get_string<uint8_t>(), codec::fallback_encoding);
          p.score = up.get<int32_t>();
          LSAMP_QUERY_DEBUG_MESSAGE("    " << p.name << ": " << p.score);
          list.push_back(p);
        }

        up.expect_end("players reply");
        return list;
      }
  };


  //! \brief List of the server's rules (public server vars).
  class rules : public query_base {
    rule_list data_;

    public:
      /*!
      \param detector  guesses the charset of the values.
      \param timeout   in usecs; 0 waits forever.
      */
      rules(connection &conn, const codec::encoding_detector &detector, usecs_t timeout = 0) {
        const usecs_t deadline = deadline_after(timeout);
        LSAMP_QUERY_DEBUG_MESSAGE("Sending rules request");
        conn.send(op_rules);
        data_ = parse(reply(conn, conn.header(op_rules), deadline), detector);
      }

      const rule_list &data() const { return data_; }

      /*!
      Layout: uint16 count, then for each rule a name and a value, both with 1
      byte lengths.

      \throws proto_error
      \throws encoding_error
      */
      static rule_list parse(const std::string &body, const codec::encoding_detector &detector) {
        codec::unpacker up(body);
        uint16_t count = up.get<uint16_t>();
        LSAMP_QUERY_DEBUG_MESSAGE("  num rules: " << count);

        rule_list list;
        list.reserve(count);
        for (uint16_t n = 0; n < count; ++n) {
          rule r;
          r.name = codec::decode(up.get_string<uint8_t>(), codec::fallback_encoding);
          codec::text value = codec::decode_text(up.get_string<uint8_t>(), detector);
          r.value = value.value;
          r.encoding = value.encoding;
          LSAMP_QUERY_DEBUG_MESSAGE("    " << r.name << " = " << r.value);
          list.push_back(r);
        }

        up.expect_end("rules reply");
        return list;
      }
  };


  /*!
  \brief Find out whether the server is open.mp.

  open.mp answers an extra opcode which SA-MP ignores, so the only way to tell
  is to wait for a while and see if anything comes back.  The wait is
  \link common::variance \endlink pings long, hence the ping parameter.
  */
  class omp_probe : public query_base {
    bool is_omp_;

    public:
      /*!
      \param rtt  a recent ping latency.

      \throws connection_error
      \throws send_error
      \throws recv_error
      */
      omp_probe(connection &conn, usecs_t rtt) : is_omp_(false) {
        const std::string nonce = make_nonce();
        const usecs_t deadline = common::now() + common::variance * rtt;

        LSAMP_QUERY_DEBUG_MESSAGE("Sending open.mp probe, waiting " << common::variance * rtt << " usecs.");
        conn.send(op_omp, nonce);

        const std::string header = conn.header(op_omp) + nonce;
        std::string body;
        while (conn.receive(header, deadline, body)) {
          if (body.empty()) {
            is_omp_ = true;
            break;
          }
        }
        LSAMP_QUERY_DEBUG_MESSAGE("open.mp: " << (int) is_omp_);
      }

      bool is_omp() const { return is_omp_; }
  };
}
}

#endif
