// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief Includes the entire lsamp library.
*/

/*!
\mainpage

\section s_intro Introduction

\b lsamp is a library for querying SA-MP and open.mp servers and running RCON
commands on them.  Everything goes over one UDP socket per server.

Refer to the 'related pages' tab to see documentation for seperate parts
of the library.  If you're not using doxygen to read this, all page
documentation resides in \link lsamp.hpp \endlink.

\section s_versions Version History

\par 0.1
- Query protocol: ping, info, players, rules.
- RCON with a reply window derived from the ping.

\par 0.2
- Charset detection for incoming text and code page selection for outgoing
  text.
- open.mp detection.
- Optional timeouts for the queries which otherwise wait forever.

\section s_plans Plans

\par 1.0
- Resolve outstanding todos and tidying.
*/

/*!
\page p_query Query Usage

\section s_query_intro Introduction

The easiest way in is \link lsamp::client \endlink.  This example pings a
server, prints its name and player count, then lists the players:

\include query_usage.cpp

Each query is also a class in \link lsamp::query \endlink which does its work
in the constructor, given a \link lsamp::connection \endlink:

\code
lsamp::connection conn("127.0.0.1", 7777);
lsamp::query::ping p(conn);
lsamp::query::omp_probe o(conn, p.latency());
\endcode

\note A connection may only have one request outstanding, because replies are
      matched by their header alone.  Use one connection per thread.

\note ping(), info(), players() and rules() will block forever if the server
      never answers.  Give them a timeout.
*/

/*!
\page p_RCON RCON Usage

\section s_rcon_intro Introduction

The following example runs 'varlist' and tells apart the ways it can be
refused:

\include rcon_usage.cpp

A call to rcon() always takes at least \link lsamp::common::variance \endlink
round trips.  See \ref p_proto "the protocol" for why.
*/

/*!
\page p_proto The Protocol

\section s_proto_format Message Format

Every datagram, both ways, starts with:

- "SAMP"
- the server's IPv4 address, 4 bytes
- the server's port, 2 bytes little endian
- an opcode byte; replies echo the request's

Then, per opcode:

- 'p' ping: 4 byte nonce; the reply is the request echoed.
- 'i' info: no payload.  Reply is bool password, uint16 players, uint16 max
  players, then name, gamemode and language with uint32 lengths.
- 'c' players: no payload.  Reply is uint16 count then count times a name
  with a uint8 length and an int32 score.
- 'r' rules: no payload.  Reply is uint16 count then count times a name and a
  value, both with uint8 lengths.
- 'o' open.mp probe: 4 byte nonce; echoed by open.mp, ignored by SA-MP.
- 'x' RCON: password and command with uint8 lengths.  Each reply datagram is
  one output line with a uint8 length.

\section s_proto_notes Notes

- there is no sequence number anywhere, so replies are matched by the header
  (and the nonce where there is one).  Stray datagrams are thrown away.
- RCON output has no line count or terminator.  You must wait for a timeout
  in order to know that the data is finished.
- a wrong RCON password gets the single line "Invalid RCON password.".  RCON
  being disabled gets nothing at all.
- servers don't say what charset their strings are in.
*/

#include <lsamp/client.hpp>
#include <lsamp/query.hpp>
#include <lsamp/rcon.hpp>
