#ifndef ONTOGRAPH_PARSING_STREAM_HPP
#define ONTOGRAPH_PARSING_STREAM_HPP

#include <istream>
#include <optional>
#include <string>
#include <common.hpp>

namespace ontograph::parsing {
#include "macros_open.hpp"

  // A class is a (finite) "stream" of `T` if...
  template <typename T>
  class IStream {
    interface(IStream);
  public:
    // It allows generating the next element (or empty if reached the end):
    virtual auto advance() -> std::optional<T> required;
    // It allows obtaining the number of elements generated so far:
    virtual auto position() const -> size_t required;
  };

  // Line source over an in-memory string. Lines end with "\n"; a trailing "\r" is dropped.
  class StringLineStream: public IStream<std::string> {
  public:
    explicit StringLineStream(std::string string):
        _string(std::move(string)) {}

    auto advance() -> std::optional<std::string> override {
      if (_offset >= _string.size()) return {};
      auto const eol = _string.find('\n', _offset);
      auto const end = (eol == std::string::npos) ? _string.size() : eol;
      auto res = _string.substr(_offset, end - _offset);
      if (!res.empty() && res.back() == '\r') res.pop_back();
      _offset = (eol == std::string::npos) ? _string.size() : eol + 1;
      _position++;
      return res;
    }
    auto position() const -> size_t override {
      return _position;
    }

  private:
    std::string _string;  // Underlying string.
    size_t _offset = 0;   // Index of the next unread character.
    size_t _position = 0; // Lines read so far.
  };

  // Line source over an input stream (e.g. an opened file). The stream must outlive this object.
  class InputLineStream: public IStream<std::string> {
  public:
    explicit InputLineStream(std::istream& in):
        _in(in) {}

    auto advance() -> std::optional<std::string> override {
      auto res = std::string();
      if (!std::getline(_in, res)) return {};
      if (!res.empty() && res.back() == '\r') res.pop_back();
      _position++;
      return res;
    }
    auto position() const -> size_t override {
      return _position;
    }

  private:
    std::istream& _in;
    size_t _position = 0;
  };

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_PARSING_STREAM_HPP
