//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "io/webdav/webdav_client.hpp"

#include <httplib.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <cstring>
#include <format>
#include <fstream>
#include <memory>
#include <set>

#include "storage/media_store.hpp"

namespace momento {
namespace {
constexpr const char* kPropfindBody =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
    "<d:propfind xmlns:d=\"DAV:\"><d:prop>"
    "<d:resourcetype/><d:getcontentlength/>"
    "</d:prop></d:propfind>";

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

auto IsElement(const xmlNode* node, const char* local_name) -> bool {
  return node->type == XML_ELEMENT_NODE &&
         std::strcmp(reinterpret_cast<const char*>(node->name), local_name) == 0;
}

auto FindDescendant(xmlNode* node, const char* local_name) -> xmlNode* {
  for (xmlNode* child = node->children; child != nullptr; child = child->next) {
    if (IsElement(child, local_name)) return child;
    if (xmlNode* found = FindDescendant(child, local_name)) return found;
  }
  return nullptr;
}

auto NodeText(xmlNode* node) -> std::string {
  xmlChar*    content = xmlNodeGetContent(node);
  std::string text    = content ? reinterpret_cast<const char*>(content) : "";
  xmlFree(content);
  return text;
}

void CollectResponses(xmlNode* node, std::vector<xmlNode*>& out) {
  for (xmlNode* child = node; child != nullptr; child = child->next) {
    if (IsElement(child, "response")) {
      out.push_back(child);
    } else if (child->children != nullptr) {
      CollectResponses(child->children, out);
    }
  }
}

auto TrimSlash(const std::string& path) -> std::string {
  if (path.size() > 1 && path.back() == '/') return path.substr(0, path.size() - 1);
  return path;
}

auto JoinPath(const std::string& base, const std::string& tail) -> std::string {
  return WebDavClient::NormalizePath(base + "/" + tail);
}
}  // namespace

WebDavClient::WebDavClient(const WebDavConfig& config) : config_(config) {
  const std::string& url       = config_.url_;
  auto               scheme_at = url.find("://");
  if (url.empty() || scheme_at == std::string::npos) {
    throw WebDavError("WebDAV url must look like https://host/path");
  }
  auto path_at = url.find('/', scheme_at + 3);
  origin_      = url.substr(0, path_at);
  std::string base =
      path_at == std::string::npos ? std::string("/") : DecodePath(url.substr(path_at));
  root_path_ = JoinPath(base, config_.root_path_);
}

auto WebDavClient::NormalizePath(const std::string& path) -> std::string {
  std::string normalized = "/";
  for (char c : path) {
    if (c == '\\') c = '/';
    if (c == '/' && normalized.back() == '/') continue;
    normalized.push_back(c);
  }
  return normalized;
}

auto WebDavClient::EncodePath(const std::string& path) -> std::string {
  std::string encoded;
  for (unsigned char c : path) {
    if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded += std::format("%{:02X}", static_cast<unsigned>(c));
    }
  }
  return encoded;
}

auto WebDavClient::DecodePath(const std::string& path) -> std::string {
  std::string decoded;
  for (size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '%' && i + 2 < path.size() &&
        std::isxdigit(static_cast<unsigned char>(path[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(path[i + 2]))) {
      decoded.push_back(static_cast<char>(std::stoi(path.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      decoded.push_back(path[i]);
    }
  }
  return decoded;
}

auto WebDavClient::ParseMultistatus(const std::string& body) -> std::vector<WebDavEntry> {
  std::unique_ptr<xmlDoc, XmlDocDeleter> doc(
      xmlReadMemory(body.data(), static_cast<int>(body.size()), "propfind.xml", nullptr,
                    XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOERROR |
                        XML_PARSE_NOWARNING));
  if (!doc) {
    throw WebDavError("Malformed PROPFIND response");
  }
  xmlNode* root = xmlDocGetRootElement(doc.get());
  if (root == nullptr || !IsElement(root, "multistatus")) {
    throw WebDavError("PROPFIND response is not a multistatus document");
  }

  std::vector<xmlNode*> responses;
  CollectResponses(root->children, responses);

  std::vector<WebDavEntry> entries;
  for (xmlNode* response : responses) {
    xmlNode* href = FindDescendant(response, "href");
    if (href == nullptr) continue;

    std::string raw = NodeText(href);
    // Some servers answer with absolute URLs
    if (auto scheme_at = raw.find("://"); scheme_at != std::string::npos) {
      auto path_at = raw.find('/', scheme_at + 3);
      raw          = path_at == std::string::npos ? "/" : raw.substr(path_at);
    }

    WebDavEntry entry;
    entry.path_          = NormalizePath(DecodePath(raw));
    entry.is_collection_ = entry.path_.back() == '/' ||
                           FindDescendant(response, "collection") != nullptr;
    if (xmlNode* length = FindDescendant(response, "getcontentlength")) {
      // An unparseable or overflowing length is left unknown
      std::string text  = NodeText(length);
      auto        first = text.find_first_not_of(" \t\r\n");
      auto        last  = text.find_last_not_of(" \t\r\n");
      const char* begin = first == std::string::npos ? text.data() : text.data() + first;
      const char* stop  = first == std::string::npos ? text.data() : text.data() + last + 1;
      int64_t     value = 0;
      auto [end, ec]    = std::from_chars(begin, stop, value);
      if (begin != stop && ec == std::errc() && end == stop && value >= 0) {
        entry.size_ = value;
      }
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

auto WebDavClient::Propfind(const std::string& path, int depth) -> std::vector<WebDavEntry> {
  httplib::Client client(origin_);
  client.set_connection_timeout(config_.timeout_seconds_, 0);
  client.set_read_timeout(config_.timeout_seconds_, 0);
  if (!config_.username_.empty()) {
    client.set_basic_auth(config_.username_, config_.password_);
  }

  httplib::Request req;
  req.method = "PROPFIND";
  req.path   = EncodePath(path);
  req.headers.emplace("Depth", std::to_string(depth));
  req.headers.emplace("Content-Type", "application/xml; charset=utf-8");
  req.body = kPropfindBody;

  auto res = client.send(req);
  if (!res) {
    throw WebDavError(std::format("PROPFIND {} failed: {}", path, httplib::to_string(res.error())));
  }
  if (res->status != 207) {
    throw WebDavError(std::format("PROPFIND {} returned HTTP {}", path, res->status));
  }
  return ParseMultistatus(res->body);
}

void WebDavClient::CheckConnection() { Propfind(root_path_, 0); }

auto WebDavClient::List(const std::string& path) -> std::vector<WebDavEntry> {
  const std::string        self = TrimSlash(NormalizePath(path));
  std::vector<WebDavEntry> children;
  for (auto& entry : Propfind(self, 1)) {
    if (TrimSlash(entry.path_) == self) continue;
    children.push_back(std::move(entry));
  }
  return children;
}

auto WebDavClient::ListFilesRecursive() -> std::vector<WebDavEntry> {
  std::vector<WebDavEntry> files;
  std::vector<std::string> pending{root_path_};
  std::set<std::string>    visited;
  while (!pending.empty()) {
    std::string dir = TrimSlash(pending.back());
    pending.pop_back();
    if (!visited.insert(dir).second) continue;

    for (auto& entry : List(dir)) {
      if (entry.is_collection_) {
        pending.push_back(entry.path_);
      } else {
        files.push_back(std::move(entry));
      }
    }
  }
  return files;
}

void WebDavClient::Download(const std::string& path, const file_path_t& local) {
  httplib::Client client(origin_);
  client.set_connection_timeout(config_.timeout_seconds_, 0);
  client.set_read_timeout(config_.timeout_seconds_, 0);
  if (!config_.username_.empty()) {
    client.set_basic_auth(config_.username_, config_.password_);
  }

  std::filesystem::create_directories(local.parent_path());
  std::ofstream out(local, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw WebDavError("Cannot create " + local.string());
  }

  int  status = 0;
  auto res    = client.Get(
      EncodePath(path),
      [&status](const httplib::Response& response) {
        status = response.status;
        return response.status == 200;
      },
      [&out](const char* data, size_t length) {
        out.write(data, static_cast<std::streamsize>(length));
        return static_cast<bool>(out);
      });
  out.close();

  if (!res || status != 200 || !out) {
    MediaStore::RemoveQuietly(local);
    if (status != 0 && status != 200) {
      throw WebDavError(std::format("GET {} returned HTTP {}", path, status));
    }
    throw WebDavError(std::format("GET {} failed: {}", path,
                                  res ? std::string("write error")
                                      : httplib::to_string(res.error())));
  }
}
};  // namespace momento
