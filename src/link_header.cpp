#include "link_header.hpp"
#include "http_client.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>

namespace sgf {

namespace {

bool is_tchar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) ||
         (c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr);
}

/// Recursive-descent reader over a single header value.
class LinkReader {
public:
  explicit LinkReader(const std::string &text) : text_(text) {}

  std::optional<std::vector<LinkValue>> links() {
    std::vector<LinkValue> out;
    do {
      auto link = read_link();
      if (!link) {
        return std::nullopt;
      }
      out.push_back(std::move(*link));
    } while (consume(','));
    skip_ws();
    if (pos_ != text_.size()) {
      return std::nullopt;
    }
    return out;
  }

private:
  void skip_ws() {
    while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t'))
      ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  std::optional<LinkValue> read_link() {
    if (!consume('<')) {
      return std::nullopt;
    }
    auto close = text_.find('>', pos_);
    if (close == std::string::npos || close == pos_) {
      return std::nullopt;
    }
    LinkValue link;
    link.uri = text_.substr(pos_, close - pos_);
    if (link.uri.find_first_of(" \t<") != std::string::npos) {
      return std::nullopt;
    }
    pos_ = close + 1;
    while (consume(';')) {
      auto name = read_token();
      if (!name || !consume('=')) {
        return std::nullopt;
      }
      skip_ws();
      auto value = pos_ < text_.size() && text_[pos_] == '"' ? read_quoted()
                                                             : read_token();
      if (!value) {
        return std::nullopt;
      }
      std::transform(name->begin(), name->end(), name->begin(),
                     [](unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                     });
      if (*name == "rel") {
        add_relations(link, *value);
      }
    }
    return link;
  }

  std::optional<std::string> read_token() {
    skip_ws();
    auto start = pos_;
    while (pos_ < text_.size() && is_tchar(text_[pos_]))
      ++pos_;
    if (pos_ == start) {
      return std::nullopt;
    }
    return text_.substr(start, pos_ - start);
  }

  std::optional<std::string> read_quoted() {
    ++pos_; // opening quote
    std::string out;
    while (pos_ < text_.size()) {
      char c = text_[pos_++];
      if (c == '"') {
        return out;
      }
      if (c == '\\') {
        if (pos_ == text_.size()) {
          break;
        }
        c = text_[pos_++];
      }
      out.push_back(c);
    }
    return std::nullopt;
  }

  static void add_relations(LinkValue &link, const std::string &value) {
    std::string current;
    auto flush = [&] {
      if (!current.empty()) {
        link.rel.push_back(current);
        current.clear();
      }
    };
    for (char c : value) {
      if (c == ' ' || c == '\t') {
        flush();
      } else {
        current.push_back(
            static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
      }
    }
    flush();
  }

  const std::string &text_;
  std::size_t pos_{0};
};

} // namespace

std::optional<std::vector<LinkValue>>
parse_link_header(const std::string &value) {
  return LinkReader(value).links();
}

std::optional<std::string> next_page_cursor(const std::string &value) {
  if (value.empty()) {
    return std::nullopt;
  }
  auto links = parse_link_header(value);
  if (!links) {
    return std::nullopt;
  }
  for (const auto &link : *links) {
    if (std::find(link.rel.begin(), link.rel.end(), "next") != link.rel.end()) {
      return link.uri;
    }
  }
  return std::nullopt;
}

std::optional<std::string>
cursor_from_headers(const std::vector<std::string> &headers) {
  auto link = find_header(headers, "Link");
  if (!link) {
    return std::nullopt;
  }
  return next_page_cursor(*link);
}

} // namespace sgf
