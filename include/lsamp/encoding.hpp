// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief Text encodings of strings on the wire.

Servers send whatever bytes their scripts were written in and say nothing about
the charset, so inbound text is run through a charset detector.  Outbound text
(the RCON password and command) has to be in a code page the server
understands; the Windows code pages 1250 to 1258 are tried in order.

All text given to or returned from the library is UTF-8.
*/

#ifndef ENCODING_HPP_m1c9ruq2
#define ENCODING_HPP_m1c9ruq2

#include <lsamp/common.hpp>

#include <unicode/utypes.h>
#include <unicode/ucnv.h>
#include <unicode/ucnv_err.h>
#include <unicode/ucsdet.h>
#include <unicode/ustring.h>

#include <sstream>
#include <string>
#include <vector>

namespace lsamp {
namespace codec {
  //! Used when detection is inconclusive, and for fields which are always 7-bit.
  const char *const fallback_encoding = "US-ASCII";

  //! First of the code pages tried for outbound text.
  const int first_code_page = 1250;
  //! Last of the code pages tried for outbound text.
  const int last_code_page = 1258;

  //! Text decoded from the wire.
  struct text {
    //! UTF-8.
    std::string value;
    //! What the bytes were decoded as.  Only of diagnostic interest.
    std::string encoding;
  };

  //! Text encoded for the wire.
  struct encoded {
    std::string bytes;
    //! Eg. 1252
    int code_page;
  };

  /*!
  \brief Guesses the charset of some bytes.

  Implement this to replace \link icu_detector \endlink, eg. to pin an encoding
  when you know what the server uses.
  */
  class encoding_detector {
    public:
      virtual ~encoding_detector() {}

      /*!
      \returns A charset name ICU can open, or an empty string if there is no
               good guess.
      */
      virtual std::string detect(const std::string &bytes) const = 0;
  };

  //! Detection using ICU's statistical charset detector.
  class icu_detector : public encoding_detector {
    public:
      //! Guesses less confident than this (out of 100) are treated as no guess.
      static const int32_t min_confidence = 10;

      /*!
      \throws encoding_error  if ICU can't create a detector.
      */
      std::string detect(const std::string &bytes) const {
        if (bytes.empty()) return std::string();

        UErrorCode status = U_ZERO_ERROR;
        UCharsetDetector *csd = ucsdet_open(&status);
        if (U_FAILURE(status)) {
          throw common::encoding_error(std::string("ucsdet_open() failed: ") + u_errorName(status));
        }

        std::string name;
        ucsdet_setText(csd, bytes.data(), static_cast<int32_t>(bytes.size()), &status);
        const UCharsetMatch *match = ucsdet_detect(csd, &status);
        if (U_SUCCESS(status) && match != NULL) {
          int32_t confidence = ucsdet_getConfidence(match, &status);
          const char *n = ucsdet_getName(match, &status);
          if (U_SUCCESS(status) && n != NULL && confidence >= min_confidence) {
            name = n;
          }
        }
        ucsdet_close(csd);
        return name;
      }
  };

  /*!
  \brief Convert \c bytes from \c encoding to UTF-8.

  Bytes which are invalid in \c encoding become substitution characters.

  \throws encoding_error  if ICU doesn't know \c encoding.
  */
  inline std::string decode(const std::string &bytes, const std::string &encoding) {
    if (bytes.empty()) return std::string();

    UErrorCode status = U_ZERO_ERROR;
    int32_t needed = ucnv_convert("UTF-8", encoding.c_str(), NULL, 0,
                                  bytes.data(), static_cast<int32_t>(bytes.size()), &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
      throw common::encoding_error("cannot decode from '" + encoding + "': " + u_errorName(status));
    }

    std::vector<char> out(static_cast<size_t>(needed) + 1);
    status = U_ZERO_ERROR;
    int32_t len = ucnv_convert("UTF-8", encoding.c_str(), &out[0], static_cast<int32_t>(out.size()),
                               bytes.data(), static_cast<int32_t>(bytes.size()), &status);
    if (U_FAILURE(status)) {
      throw common::encoding_error("cannot decode from '" + encoding + "': " + u_errorName(status));
    }
    return std::string(&out[0], static_cast<size_t>(len));
  }

  //! Detect the charset of \c bytes and decode them.  \throws encoding_error
  inline text decode_text(const std::string &bytes, const encoding_detector &detector) {
    text t;
    t.encoding = detector.detect(bytes);
    if (t.encoding.empty()) t.encoding = fallback_encoding;
    t.value = decode(bytes, t.encoding);
    return t;
  }

  //! ICU's name for a Windows code page.
  inline std::string code_page_name(int code_page) {
    std::ostringstream ss;
    ss << "windows-" << code_page;
    return ss.str();
  }

  namespace detail {
    //! \returns false if some character has no mapping in \c code_page.
    inline bool encode_as(const std::vector<UChar> &utf16, int32_t len, int code_page, std::string &out) {
      const std::string name = code_page_name(code_page);

      UErrorCode status = U_ZERO_ERROR;
      UConverter *conv = ucnv_open(name.c_str(), &status);
      if (U_FAILURE(status)) {
        throw common::encoding_error("ucnv_open(" + name + ") failed: " + u_errorName(status));
      }

      ucnv_setFromUCallBack(conv, UCNV_FROM_U_CALLBACK_STOP, NULL, NULL, NULL, &status);
      if (U_FAILURE(status)) {
        ucnv_close(conv);
        throw common::encoding_error(std::string("ucnv_setFromUCallBack() failed: ") + u_errorName(status));
      }

      // single byte code pages, so never more bytes than UTF-16 units.
      std::vector<char> buf(static_cast<size_t>(len) + 1);
      int32_t n = ucnv_fromUChars(conv, &buf[0], static_cast<int32_t>(buf.size()), &utf16[0], len, &status);
      ucnv_close(conv);

      if (status == U_INVALID_CHAR_FOUND || status == U_ILLEGAL_CHAR_FOUND) {
        return false;
      }
      else if (U_FAILURE(status)) {
        throw common::encoding_error("encoding as " + name + " failed: " + u_errorName(status));
      }

      out.assign(&buf[0], static_cast<size_t>(n));
      return true;
    }
  }

  /*!
  \brief Encode UTF-8 \c s in the first of the code pages 1250 to 1258 which can
         represent all of it.

  \throws encoding_error  if \c s is not valid UTF-8 or no code page will do.
  */
  inline encoded encode(const std::string &s) {
    encoded e;
    e.code_page = first_code_page;
    if (s.empty()) return e;

    UErrorCode status = U_ZERO_ERROR;
    int32_t len = 0;
    u_strFromUTF8(NULL, 0, &len, s.data(), static_cast<int32_t>(s.size()), &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
      throw common::encoding_error(std::string("invalid UTF-8 text: ") + u_errorName(status));
    }

    std::vector<UChar> utf16(static_cast<size_t>(len) + 1);
    status = U_ZERO_ERROR;
    u_strFromUTF8(&utf16[0], static_cast<int32_t>(utf16.size()), &len,
                  s.data(), static_cast<int32_t>(s.size()), &status);
    if (U_FAILURE(status)) {
      throw common::encoding_error(std::string("invalid UTF-8 text: ") + u_errorName(status));
    }

    // ICU passes C1 controls straight through, but no Windows code page
    // defines them.
    for (int32_t i = 0; i < len; ++i) {
      if (utf16[i] >= 0x80 && utf16[i] <= 0x9F) {
        std::ostringstream ss;
        ss << "'" << s << "' contains the C1 control U+00"
           << std::hex << std::uppercase << static_cast<int>(utf16[i])
           << " which no code page can encode";
        throw common::encoding_error(ss.str());
      }
    }

    for (int cp = first_code_page; cp <= last_code_page; ++cp) {
      if (detail::encode_as(utf16, len, cp, e.bytes)) {
        LSAMP_COMMON_DEBUG_MESSAGE("Encoded " << s.size() << " byte(s) as " << code_page_name(cp));
        e.code_page = cp;
        return e;
      }
    }

    std::ostringstream ss;
    ss << "'" << s << "' cannot be encoded in any of the code pages "
       << first_code_page << " to " << last_code_page;
    throw common::encoding_error(ss.str());
  }
}
}

#endif
