#include "model/CodeModel.h"
#include <unordered_map>

namespace {
    const std::unordered_map<std::string, ElementKind>& kindTable() {
        static const std::unordered_map<std::string, ElementKind> table = {
            {"CLASS", ElementKind::Class},
            {"INTERFACE", ElementKind::Interface},
            {"ABSTRACT_CLASS", ElementKind::AbstractClass},
            {"ENUM", ElementKind::Enum},
            {"ANNOTATION", ElementKind::Annotation},
            {"RECORD", ElementKind::Record},
            {"STRUCT", ElementKind::Struct},
            {"TRAIT", ElementKind::Trait},
            {"PROTOCOL", ElementKind::Protocol},
            {"OBJECT", ElementKind::Object},
            {"METHOD", ElementKind::Method},
            {"FUNCTION", ElementKind::Function},
            {"CONSTRUCTOR", ElementKind::Constructor},
            {"FIELD", ElementKind::Field},
            {"VARIABLE", ElementKind::Variable},
            {"PROPERTY", ElementKind::Property},
            {"CONSTANT", ElementKind::Constant},
            {"MODULE", ElementKind::Module},
            {"REFERENCE", ElementKind::Reference},
        };
        return table;
    }
}

std::string kindName(ElementKind kind) {
    switch (kind) {
        case ElementKind::Class: return "CLASS";
        case ElementKind::Interface: return "INTERFACE";
        case ElementKind::AbstractClass: return "ABSTRACT_CLASS";
        case ElementKind::Enum: return "ENUM";
        case ElementKind::Annotation: return "ANNOTATION";
        case ElementKind::Record: return "RECORD";
        case ElementKind::Struct: return "STRUCT";
        case ElementKind::Trait: return "TRAIT";
        case ElementKind::Protocol: return "PROTOCOL";
        case ElementKind::Object: return "OBJECT";
        case ElementKind::Method: return "METHOD";
        case ElementKind::Function: return "FUNCTION";
        case ElementKind::Constructor: return "CONSTRUCTOR";
        case ElementKind::Field: return "FIELD";
        case ElementKind::Variable: return "VARIABLE";
        case ElementKind::Property: return "PROPERTY";
        case ElementKind::Constant: return "CONSTANT";
        case ElementKind::Module: return "MODULE";
        case ElementKind::Reference: return "REFERENCE";
        default: return "SYMBOL";
    }
}

std::optional<ElementKind> parseKind(const std::string& name) {
    auto it = kindTable().find(name);
    if (it == kindTable().end()) return std::nullopt;
    return it->second;
}

bool isTypeKind(ElementKind kind) {
    switch (kind) {
        case ElementKind::Class:
        case ElementKind::Interface:
        case ElementKind::AbstractClass:
        case ElementKind::Enum:
        case ElementKind::Annotation:
        case ElementKind::Record:
        case ElementKind::Struct:
        case ElementKind::Trait:
        case ElementKind::Protocol:
        case ElementKind::Object:
            return true;
        default:
            return false;
    }
}

bool isCallableKind(ElementKind kind) {
    return kind == ElementKind::Method || kind == ElementKind::Function || kind == ElementKind::Constructor;
}

bool isVariableKind(ElementKind kind) {
    return kind == ElementKind::Field || kind == ElementKind::Variable ||
           kind == ElementKind::Property || kind == ElementKind::Constant;
}

bool belongsToCategory(ElementKind kind, NameCategory category) {
    switch (category) {
        case NameCategory::Types: return isTypeKind(kind);
        case NameCategory::Callables: return isCallableKind(kind);
        case NameCategory::Variables: return isVariableKind(kind);
    }
    return false;
}

std::vector<std::string> Signature::parameterTypes() const {
    std::vector<std::string> types;
    types.reserve(parameters.size());
    for (const auto& p : parameters) {
        types.push_back(p.type);
    }
    return types;
}
