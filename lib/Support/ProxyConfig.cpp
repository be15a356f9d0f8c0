//===- ProxyConfig.cpp - Proxy layer configuration ------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements loading the proxy layer configuration from YAML.
//
//===----------------------------------------------------------------------===//

#include "simproxy/Support/ProxyConfig.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"
#include <functional>
#include <vector>

using namespace simproxy;

static const llvm::StringRef configFileNames[] = {
    "simproxy.yaml", ".simproxy.yaml", "simproxy.yml", ".simproxy.yml"};

llvm::ArrayRef<llvm::StringRef> simproxy::getProxyConfigFileNames() {
  return configFileNames;
}

//===----------------------------------------------------------------------===//
// YAML Parsing Helpers
//===----------------------------------------------------------------------===//

namespace {

/// Get scalar value from a YAML node.
llvm::StringRef getScalar(llvm::yaml::Node *node,
                          llvm::SmallVectorImpl<char> &storage) {
  if (auto *scalar = llvm::dyn_cast<llvm::yaml::ScalarNode>(node))
    return scalar->getValue(storage);
  return "";
}

bool getBool(llvm::yaml::Node *node) {
  llvm::SmallString<16> storage;
  auto val = getScalar(node, storage);
  return val == "true" || val == "yes" || val == "1" || val == "on";
}

void parseStringSequence(llvm::yaml::Node *node,
                         std::vector<std::string> &out) {
  if (auto *seq = llvm::dyn_cast<llvm::yaml::SequenceNode>(node)) {
    for (auto &item : *seq) {
      llvm::SmallString<128> storage;
      auto val = getScalar(&item, storage);
      if (!val.empty())
        out.push_back(val.str());
    }
  }
}

/// Parse a YAML mapping node with a callback for each key-value pair. Stops
/// at the first error.
llvm::Error
parseMapping(llvm::yaml::MappingNode *mapping,
             std::function<llvm::Error(llvm::StringRef, llvm::yaml::Node *)>
                 cb) {
  for (auto &entry : *mapping) {
    auto *keyNode = llvm::dyn_cast<llvm::yaml::ScalarNode>(entry.getKey());
    if (!keyNode)
      continue;

    llvm::SmallString<64> keyStorage;
    llvm::StringRef key = keyNode->getValue(keyStorage);

    if (auto err = cb(key, entry.getValue()))
      return err;
  }
  return llvm::Error::success();
}

llvm::Error parseHandleSection(llvm::yaml::MappingNode *node,
                               ProxyConfig &config) {
  return parseMapping(
      node, [&](llvm::StringRef key, llvm::yaml::Node *value) -> llvm::Error {
    llvm::SmallString<32> storage;
    if (key == "integer_fast_path_width") {
      unsigned width;
      if (getScalar(value, storage).getAsInteger(10, width))
        return llvm::createStringError(
            std::errc::invalid_argument,
            "integer_fast_path_width must be an unsigned integer");
      config.setIntegerFastPathWidth(width);
    } else if (key == "warnings") {
      config.setWarningsEnabled(getBool(value));
    }
    return llvm::Error::success();
  });
}

llvm::Error parseGenerateArraySection(llvm::yaml::MappingNode *node,
                                      ProxyConfig &config) {
  return parseMapping(
      node, [&](llvm::StringRef key, llvm::yaml::Node *value) -> llvm::Error {
    if (key != "index_patterns")
      return llvm::Error::success();
    std::vector<std::string> patterns;
    parseStringSequence(value, patterns);
    auto patternsOrErr = IndexNamePatterns::create(patterns);
    if (!patternsOrErr)
      return patternsOrErr.takeError();
    config.getIndexPatterns() = std::move(*patternsOrErr);
    return llvm::Error::success();
  });
}

} // namespace

//===----------------------------------------------------------------------===//
// ProxyConfig Implementation
//===----------------------------------------------------------------------===//

ProxyConfig::ProxyConfig() = default;
ProxyConfig::~ProxyConfig() = default;

llvm::Expected<std::unique_ptr<ProxyConfig>>
ProxyConfig::loadFromFile(llvm::StringRef filePath) {
  auto fileOrErr = llvm::MemoryBuffer::getFile(filePath);
  if (auto ec = fileOrErr.getError())
    return llvm::createStringError(ec, "failed to open proxy config file: %s",
                                   filePath.str().c_str());
  return loadFromYAML((*fileOrErr)->getBuffer());
}

llvm::Expected<std::unique_ptr<ProxyConfig>>
ProxyConfig::loadFromYAML(llvm::StringRef yamlContent) {
  auto config = std::make_unique<ProxyConfig>();

  // Handle empty content as valid empty config
  if (yamlContent.trim().empty())
    return std::move(config);

  llvm::SourceMgr srcMgr;
  llvm::yaml::Stream stream(yamlContent, srcMgr);

  auto docIt = stream.begin();
  if (docIt == stream.end())
    return std::move(config);

  auto *root =
      llvm::dyn_cast_or_null<llvm::yaml::MappingNode>(docIt->getRoot());
  if (!root)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "proxy config root must be a mapping");

  auto err =
      parseMapping(root, [&](llvm::StringRef key,
                             llvm::yaml::Node *value) -> llvm::Error {
        auto *mapping = llvm::dyn_cast<llvm::yaml::MappingNode>(value);
        if (!mapping)
          return llvm::Error::success();
        if (key == "handles")
          return parseHandleSection(mapping, *config);
        if (key == "generate_arrays")
          return parseGenerateArraySection(mapping, *config);
        return llvm::Error::success();
      });
  if (err)
    return std::move(err);

  if (stream.failed())
    return llvm::createStringError(std::errc::invalid_argument,
                                   "malformed proxy config YAML");

  return std::move(config);
}

llvm::Expected<std::unique_ptr<ProxyConfig>>
ProxyConfig::findAndLoad(llvm::StringRef directory) {
  llvm::SmallString<256> path;

  for (const auto &name : configFileNames) {
    path = directory;
    llvm::sys::path::append(path, name);

    if (llvm::sys::fs::exists(path))
      return loadFromFile(path);
  }

  return llvm::createStringError(std::errc::no_such_file_or_directory,
                                 "no proxy configuration file found in: %s",
                                 directory.str().c_str());
}
