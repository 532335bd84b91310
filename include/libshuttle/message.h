// MIT License
//
// Copyright (c) 2019 the Shuttle authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
#ifndef SHUTTLE_INCLUDE_LIBSHUTTLE_MESSAGE_H_
#define SHUTTLE_INCLUDE_LIBSHUTTLE_MESSAGE_H_

// The following are UBUNTU/LINUX ONLY terminal color codes.
#define RESET       "\033[0m"
#define RED         "\033[31m"              /* Red          */
#define GREEN       "\033[32m"              /* Green        */
#define BLUE        "\033[34m"              /* Blue         */
#define MAGENTA     "\033[35m"              /* Magenta      */
#define CYAN        "\033[36m"              /* Cyan         */

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// Provides colored, time-stamped output on the log stream (stderr). Standard
// output is left to results (see tool/shuttle).
// Usage:
//     Message print("matrix");
//     print(MessageType::Info) << "built " << 42 << " blocks" << std::endl;
namespace shuttle {

enum class MessageType {
  Default,  // no color
  Info,     // blue
  Warning,  // magenta
  Error,    // red
  Success,  // green
  Debug,    // cyan
};

class MessageStreamBuffer : public std::streambuf {
 public:
  MessageStreamBuffer(std::streambuf* s, const std::string& n)
      : type(MessageType::Default), name(n), sb(s) {}

  MessageType type;
  std::string name;

  // Global switch; when set nothing reaches the sink.
  static std::atomic<bool>& quiet() {
    static std::atomic<bool> q(false);
    return q;
  }

 private:
  bool head = true;
  std::streambuf* sb;
  std::string line_;

  // Lines are assembled privately and handed to the sink whole so that
  // messages from worker threads do not interleave.
  static std::mutex& sinkmx() {
    static std::mutex mx;
    return mx;
  }

  int sync() {  // override
    flush_line();
    sb->pubsync();
    head = true;
    type = MessageType::Default;
    return 0;
  }

  /* Message has no buffer; every char "overflows". Prepend the color code
   * and the timestamp to each line. */
  int overflow(int c) {
    if (c == traits_type::eof()) return traits_type::not_eof(c);
    if (head) {
      line_.clear();
      switch (type) {
        case MessageType::Default: line_ += RESET;   break;
        case MessageType::Info:    line_ += BLUE;    break;
        case MessageType::Warning: line_ += MAGENTA; break;
        case MessageType::Error:   line_ += RED;     break;
        case MessageType::Success: line_ += GREEN;   break;
        case MessageType::Debug:   line_ += CYAN;    break;
      }
      std::time_t now_c =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
      std::tm tm;
      localtime_r(&now_c, &tm);
      std::ostringstream ts;
      ts << std::setfill('0') << "["
         << std::setw(2) << tm.tm_hour << ":"
         << std::setw(2) << tm.tm_min  << ":"
         << std::setw(2) << tm.tm_sec  << "]"
         << "[" << name << "] ";
      line_ += ts.str();
      head = false;
    }
    line_ += static_cast<char>(c);
    if (c == int('\n')) {
      flush_line();
      head = true;
    }
    return c;
  }

  void flush_line() {
    if (line_.empty()) return;
    if (!quiet()) {
      line_ += RESET;
      std::lock_guard<std::mutex> lock(sinkmx());
      sb->sputn(line_.data(), line_.size());
    }
    line_.clear();
  }
};

class Message : public std::ostream {
 public:
  Message(const std::string& n = "noname")
      : std::ostream(nullptr), buf(std::clog.rdbuf(), n) {
    this->rdbuf(&buf);
  }

  Message(const Message &) = delete;
  Message & operator=(const Message &) = delete;

  Message& operator()(MessageType t) {
    buf.type = t;
    return *this;
  }

  const std::string & name() const { return buf.name; }

  static void quiet(bool q) { MessageStreamBuffer::quiet() = q; }

 private:
  MessageStreamBuffer buf;
};

}  // namespace shuttle

#endif // SHUTTLE_INCLUDE_LIBSHUTTLE_MESSAGE_H_
