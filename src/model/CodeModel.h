#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Opaque handle to one declaration or reference site in a code model.
 *
 * Handles are only meaningful for the model that produced them. An id of 0
 * never names an element.
 */
struct ElementHandle {
    std::int64_t id = 0;

    bool isValid() const { return id > 0; }
    bool operator==(const ElementHandle& other) const { return id == other.id; }
    bool operator!=(const ElementHandle& other) const { return id != other.id; }
    bool operator<(const ElementHandle& other) const { return id < other.id; }
};

struct ElementHandleHash {
    size_t operator()(const ElementHandle& h) const { return std::hash<std::int64_t>()(h.id); }
};

enum class ElementKind {
    Class,
    Interface,
    AbstractClass,
    Enum,
    Annotation,
    Record,
    Struct,
    Trait,
    Protocol,
    Object,
    Method,
    Function,
    Constructor,
    Field,
    Variable,
    Property,
    Constant,
    Module,
    Reference,
    Unknown
};

// "CLASS", "ABSTRACT_CLASS", "METHOD", ...
std::string kindName(ElementKind kind);
std::optional<ElementKind> parseKind(const std::string& name);
bool isTypeKind(ElementKind kind);
bool isCallableKind(ElementKind kind);
bool isVariableKind(ElementKind kind);

enum class SearchScope {
    Project,
    ProjectAndLibraries
};

// Name enumeration buckets, visited in this order by symbol search.
enum class NameCategory {
    Types,
    Callables,
    Variables
};

bool belongsToCategory(ElementKind kind, NameCategory category);

struct SourceLocation {
    std::string path;
    int line = 0;   // 1-based
    int column = 0; // 1-based, 0 if unknown
};

struct Parameter {
    std::string name;
    std::string type;
};

struct Signature {
    std::vector<Parameter> parameters;
    std::string returnType;

    std::vector<std::string> parameterTypes() const;
};

/**
 * @brief One entry of a type's declared supertype list.
 *
 * The declared name is always present; `resolved` is empty when the reference
 * points at something the model cannot resolve (external dependency, broken
 * import).
 */
struct SupertypeRef {
    std::string declaredName;
    bool isInterface = false;
    std::optional<ElementHandle> resolved;
};

struct CallSite {
    std::string text;
    SourceLocation location;
    std::optional<ElementHandle> target;
};

/**
 * @brief Read-only access to a host's pre-built code model.
 *
 * All enumeration methods that may produce large result sets take a visitor;
 * returning false from the visitor stops the enumeration. Implementations may
 * throw IndexNotReadyException from any method while their backing index is
 * still being built.
 */
class ICodeModel {
public:
    using ElementVisitor = std::function<bool(const ElementHandle&)>;
    using NameVisitor = std::function<bool(const std::string&)>;

    virtual ~ICodeModel() = default;

    virtual bool isIndexReady() const = 0;
    virtual bool hasLanguageSupport(const std::string& languageId) const = 0;

    virtual std::optional<ElementHandle> resolveAt(const std::string& path, int line, int column) const = 0;
    virtual std::optional<ElementHandle> resolveByQualifiedName(const std::string& qualifiedName) const = 0;

    // Superclass first, then interfaces, in declaration order.
    virtual std::vector<SupertypeRef> declaredSupertypes(const ElementHandle& type) const = 0;
    virtual void transitiveSubtypes(const ElementHandle& type, const ElementVisitor& visitor) const = 0;

    virtual void overridingMethods(const ElementHandle& method, const ElementVisitor& visitor) const = 0;
    // Direct ancestors only.
    virtual std::vector<ElementHandle> overriddenMethods(const ElementHandle& method) const = 0;
    virtual std::vector<ElementHandle> methodsOf(const ElementHandle& type) const = 0;

    virtual void referencesTo(const ElementHandle& element, const ElementVisitor& visitor) const = 0;
    virtual std::optional<ElementHandle> enclosingDeclaration(const ElementHandle& element) const = 0;
    virtual void callSitesWithin(const ElementHandle& callable, const std::function<bool(const CallSite&)>& visitor) const = 0;

    virtual void allDeclaredNames(NameCategory category, SearchScope scope, const std::string& languageId,
                                  const NameVisitor& visitor) const = 0;
    virtual void declarationsNamed(const std::string& name, NameCategory category, SearchScope scope,
                                   const std::string& languageId, const ElementVisitor& visitor) const = 0;

    virtual std::optional<SourceLocation> locationOf(const ElementHandle& element) const = 0;
    virtual ElementKind kindOf(const ElementHandle& element) const = 0;
    virtual std::string languageOf(const ElementHandle& element) const = 0;
    virtual Signature signatureOf(const ElementHandle& element) const = 0;
    virtual std::string nameOf(const ElementHandle& element) const = 0;
    virtual std::optional<std::string> qualifiedNameOf(const ElementHandle& element) const = 0;
};
