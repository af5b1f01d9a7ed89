/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#ifndef PHREATIC_ERRORS_HH_
#define PHREATIC_ERRORS_HH_

#include <cstddef>
#include <string>

#include "exceptions.hh"

namespace Errors {

class Message : public Exceptions::Phreatic_exception {
 public:
  explicit Message() : message_(){};
  explicit Message(const char* message) : message_(message){};
  explicit Message(const std::string& message) : message_(message){};
  ~Message() noexcept {};

  const char* what() const noexcept override { return message_.c_str(); }

  void add_data(const char* data) { message_ += data; }
  void add_data(const std::string& data) { message_ += data; }

 public:
  std::string message_;
};

Message& operator<<(Message& message, const char* data);
Message& operator<<(Message& message, const std::string& data);
Message& operator<<(Message& message, double datum);
Message& operator<<(Message& message, int datum);
Message& operator<<(Message& message, std::size_t datum);

// Registry misuse. These are configuration or programming errors and are
// fatal to a run.
class DuplicateNameError : public Message {
  using Message::Message;
};
class NotFoundError : public Message {
  using Message::Message;
};
class InvalidShapeError : public Message {
  using Message::Message;
};
class KindMismatchError : public Message {
  using Message::Message;
};

} // namespace Errors

#endif
