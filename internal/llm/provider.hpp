#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jobmeter::llm {

enum class Role { kSystem, kUser, kAssistant };

struct Message {
  Role        role = Role::kUser;
  std::string text;
};

enum class AttachmentKind { kPdf, kDocx, kText, kOther };

struct Attachment {
  std::string    filename;
  std::string    content_type;
  AttachmentKind kind = AttachmentKind::kOther;
  std::string    bytes;
};

struct Request {
  std::string             model;
  std::vector<Message>    messages;
  std::vector<Attachment> attachments;
};

struct TokenUsage {
  int64_t prompt   = 0;
  int64_t response = 0;
  int64_t total    = 0;
};

struct Response {
  std::string text;
  TokenUsage  token_usage;
  std::string provider;
  std::string model;
  std::string raw;
};

/*
  External LLM capability. The engine reads nothing from a response beyond
  text and token_usage.total.

  Execute() throws util::ProviderError on transport or HTTP failure and
  must be safe to call from several threads at once.
*/
class Provider {
 public:
  virtual ~Provider() = default;

  virtual Response Execute(const Request& request) = 0;
};

} // namespace jobmeter::llm
