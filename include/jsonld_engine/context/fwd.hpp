#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for jsonld_context module

#include <memory>

namespace jsonld_context {

struct TermDefinition;
struct ContextData;
class ActiveContext;
class InverseContext;

struct RemoteDocument;
class DocumentLoader;
class NoLoader;
class StaticLoader;
class FileLoader;
class CachingLoader;

struct ContextProcessingOptions;

/// Shared immutable term definition
using TermPtr = std::shared_ptr<const TermDefinition>;

/// Shared immutable context snapshot
using ContextPtr = std::shared_ptr<const ActiveContext>;

/// Shared document loader
using LoaderPtr = std::shared_ptr<DocumentLoader>;

} // namespace jsonld_context
