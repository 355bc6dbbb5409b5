// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief Reading and writing the protocol's primitive types.

Integers are little endian on the wire.  Strings are raw bytes prefixed by
their length; the width of the length field depends on the message:

- 4 bytes: server name, gamemode and language in an info reply.
- 1 byte: player names, rule names and values, RCON password, command and
  reply lines.

The string readers here do not interpret the bytes at all; see
\link encoding.hpp \endlink for that.
*/

#ifndef CODEC_HPP_x83kd0vb
#define CODEC_HPP_x83kd0vb

#include <lsamp/common.hpp>

#include <limits>
#include <sstream>
#include <string>

//! Reading and writing the wire format.
namespace lsamp {
namespace codec {
#ifdef LSAMP_SYS_LITTLE_ENDIAN
  template <typename T>
  T server_to_native_endian(T x) {
    return x;
  }

  template <typename T>
  T native_to_server_endian(T x) {
    return x;
  }
#else
  template <typename T>
  T swap_endian(T x) {
    size_t i = 0, j = sizeof(T) - 1;
    char t;
    char *y = (char *) &x;
    while (i < j) {
      t = y[i];
      y[i] = y[j];
      y[j] = t;
      --j; ++i;
    }
    return x;
  }

  template <typename T>
  T server_to_native_endian(T x) {
    return swap_endian(x);
  }

  template <typename T>
  T native_to_server_endian(T x) {
    return swap_endian(x);
  }
#endif

  /*!
  \brief Reads values from a datagram body, front to back.

  Reading past the end throws rather than returning garbage, and
  \link expect_end() \endlink checks the other direction, so a record parser
  that calls it last has proved the datagram was exactly one record.

  \warning Holds a reference to the data; it must outlive the unpacker.
  */
  class unpacker {
    const std::string &data_;
    size_t idx_;

    public:
      explicit unpacker(const std::string &data) : data_(data), idx_(0) {}

      //! Fixed width integer.  \throws proto_error
      template <typename T>
      T get() {
        need(sizeof(T), "integer");
        T v;
        memcpy(&v, data_.data() + idx_, sizeof(T));
        idx_ += sizeof(T);
        return server_to_native_endian(v);
      }

      //! A one byte boolean.  \throws proto_error
      bool get_bool() {
        return get<uint8_t>() != 0;
      }

      //! \throws proto_error
      std::string get_bytes(size_t n) {
        need(n, "string");
        std::string s(data_, idx_, n);
        idx_ += n;
        return s;
      }

      /*!
      \brief A string prefixed by a \c Length sized length.

      \throws proto_error  if either the length or the bytes are cut off.
      */
      template <typename Length>
      std::string get_string() {
        Length n = get<Length>();
        return get_bytes(static_cast<size_t>(n));
      }

      //! Bytes not read yet.
      size_t remaining() const { return data_.size() - idx_; }

      //! Bytes read so far.
      size_t consumed() const { return idx_; }

      //! \throws proto_error  naming \c what if anything is left.
      void expect_end(const char *what) const {
        if (remaining() != 0) {
          std::ostringstream ss;
          ss << what << ": " << remaining() << " unexpected trailing byte(s) after "
             << consumed() << " byte(s) of data";
          throw common::proto_error(ss.str());
        }
      }

    private:
      void need(size_t n, const char *what) const {
        if (remaining() < n) {
          std::ostringstream ss;
          ss << "datagram truncated reading " << what << ": needed " << n
             << " byte(s) but " << remaining() << " remain";
          throw common::proto_error(ss.str());
        }
      }
  };

  //! Builds an outgoing payload.
  class packer {
    std::string data_;

    public:
      //! Fixed width integer.
      template <typename T>
      packer &add(T v) {
        v = native_to_server_endian(v);
        data_.append(reinterpret_cast<const char *>(&v), sizeof(T));
        return *this;
      }

      packer &add_bool(bool b) {
        return add<uint8_t>(b ? 1 : 0);
      }

      /*!
      \brief The bytes of \c s behind a \c Length sized length.

      \throws encoding_error  if \c s is too long for the length field.
      */
      template <typename Length>
      packer &add_string(const std::string &s) {
        if (s.size() > static_cast<size_t>(std::numeric_limits<Length>::max())) {
          std::ostringstream ss;
          ss << "string of " << s.size() << " bytes does not fit a "
             << sizeof(Length) << " byte length field";
          throw common::encoding_error(ss.str());
        }
        add<Length>(static_cast<Length>(s.size()));
        data_ += s;
        return *this;
      }

      const std::string &data() const { return data_; }
  };
}
}

#endif
