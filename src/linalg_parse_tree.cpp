#include "linalg_parse_tree.h"

#include <fmt/format.h>

namespace Linalg {

namespace Code {

ParseTree::ParseTree() noexcept {}

void ParseTree::clear() noexcept {
    data.clear();
    constants.clear();
    nary_construction_stack.clear();
    nary_start.clear();
    num_nodes = 0;
    root = NONE;

    #ifndef NDEBUG
    created.clear();
    #endif
}

bool ParseTree::empty() const noexcept {
    return data.empty();
}

Op ParseTree::getOp(ParseNode pn) const noexcept {
    assert(isNode(pn));
    return static_cast<Op>(data[pn+OP_OFFSET]);
}

size_t ParseTree::getFlag(ParseNode pn) const noexcept {
    assert(isNode(pn));
    return data[pn+FLAG_OFFSET];
}

size_t ParseTree::getNumArgs(ParseNode pn) const noexcept {
    assert(isNode(pn));
    return data[pn+NUM_ARGS_OFFSET];
}

ParseNode ParseTree::arg(ParseNode pn, size_t index) const noexcept {
    assert(index < getNumArgs(pn));
    return data[pn+FIXED_FIELDS+index];
}

template<size_t index>
ParseNode ParseTree::arg(ParseNode pn) const noexcept {
    assert(index < getNumArgs(pn));
    return data[pn+FIXED_FIELDS+index];
}

ParseNode ParseTree::lhs(ParseNode pn) const noexcept {
    assert(getNumArgs(pn) == 2);
    return arg<0>(pn);
}

ParseNode ParseTree::rhs(ParseNode pn) const noexcept {
    assert(getNumArgs(pn) == 2);
    return arg<1>(pn);
}

ParseNode ParseTree::child(ParseNode pn) const noexcept {
    assert(getNumArgs(pn) == 1);
    return arg<0>(pn);
}

double ParseTree::getDouble(ParseNode pn) const noexcept {
    assert(getOp(pn) == OP_CONSTANT);
    return constants[getFlag(pn)];
}

char ParseTree::getPlaceholder(ParseNode pn) const noexcept {
    assert(getOp(pn) == OP_PLACEHOLDER);
    return static_cast<char>(getFlag(pn));
}

BuiltinId ParseTree::getBuiltin(ParseNode pn) const noexcept {
    assert(getOp(pn) == OP_CALL);
    return static_cast<BuiltinId>(getFlag(pn));
}

size_t ParseTree::numNodes() const noexcept {
    return num_nodes;
}

std::string ParseTree::str(ParseNode pn) const alloc_except {
    switch (getOp(pn)) {
        case OP_PLACEHOLDER: return std::string(1, getPlaceholder(pn));
        case OP_CONSTANT: return fmt::format("{:g}", getDouble(pn));
        case OP_TRANSPOSE: return str(child(pn)) + ".T";
        case OP_UNARY_MINUS: return "-" + str(child(pn));
        case OP_CALL:{
            std::string out(builtinInfo(getBuiltin(pn)).name);
            out += '(';
            for(size_t i = 0; i < getNumArgs(pn); i++){
                if(i) out += ", ";
                out += str(arg(pn, i));
            }
            out += ')';
            return out;
        }
        case OP_ERROR: return "<error>";
        default:
            assert(isBinary(getOp(pn)));
            return '(' + str(lhs(pn)) + ' ' + std::string(opSymbol(getOp(pn))) + ' ' + str(rhs(pn)) + ')';
    }
}

std::string ParseTree::str() const alloc_except {
    return root == NONE ? std::string() : str(root);
}

bool ParseTree::equivalent(ParseNode pn, const ParseTree& other, ParseNode other_pn) const noexcept {
    if(getOp(pn) != other.getOp(other_pn)) return false;
    if(getNumArgs(pn) != other.getNumArgs(other_pn)) return false;

    switch (getOp(pn)) {
        case OP_CONSTANT:
            if(getDouble(pn) != other.getDouble(other_pn)) return false;
            break;
        case OP_PLACEHOLDER:
        case OP_CALL:
            if(getFlag(pn) != other.getFlag(other_pn)) return false;
            break;
        default: break;
    }

    for(size_t i = 0; i < getNumArgs(pn); i++)
        if(!equivalent(arg(pn, i), other, other.arg(other_pn, i))) return false;

    return true;
}

bool ParseTree::equivalent(const ParseTree& other) const noexcept {
    if(root == NONE || other.root == NONE) return root == other.root;
    return equivalent(root, other, other.root);
}

ParseNode ParseTree::allocate(Op type, size_t flag, size_t num_args) alloc_except {
    ParseNode pn = data.size();
    #ifndef NDEBUG
    created.insert(pn);
    #endif
    data.resize(data.size() + FIXED_FIELDS);
    data[pn+OP_OFFSET] = type;
    data[pn+FLAG_OFFSET] = flag;
    data[pn+NUM_ARGS_OFFSET] = num_args;
    num_nodes++;

    return pn;
}

template<size_t N>
ParseNode ParseTree::addNode(Op type, const std::array<ParseNode, N>& children, size_t flag) alloc_except {
    #ifndef NDEBUG
    for(ParseNode child : children) assert(isNode(child));
    #endif

    ParseNode pn = allocate(type, flag, N);
    data.insert(data.end(), children.begin(), children.end());

    return pn;
}

ParseNode ParseTree::addTerminal(Op type, size_t flag) alloc_except {
    return addNode<0>(type, {}, flag);
}

ParseNode ParseTree::addPlaceholder(char name) alloc_except {
    assert(name >= 'A' && name <= 'Z');
    return addTerminal(OP_PLACEHOLDER, static_cast<size_t>(name));
}

ParseNode ParseTree::addConstant(double val) alloc_except {
    constants.push_back(val);
    return addTerminal(OP_CONSTANT, constants.size()-1);
}

ParseNode ParseTree::addUnary(Op type, ParseNode child) alloc_except {
    return addNode<1>(type, {child});
}

ParseNode ParseTree::addBinary(Op type, ParseNode lhs, ParseNode rhs) alloc_except {
    assert(isBinary(type));
    return addNode<2>(type, {lhs, rhs});
}

void ParseTree::prepareNary() alloc_except {
    nary_start.push_back(nary_construction_stack.size());
}

void ParseTree::addNaryChild(ParseNode pn) alloc_except {
    assert(isNode(pn));
    nary_construction_stack.push_back(pn);
}

ParseNode ParseTree::finishNary(Op type, size_t flag) alloc_except {
    assert(!nary_start.empty());
    size_t N = nary_construction_stack.size()-nary_start.back();

    ParseNode pn = allocate(type, flag, N);
    data.insert(data.end(), nary_construction_stack.end()-N, nary_construction_stack.end());

    nary_construction_stack.resize(nary_start.back());
    nary_start.pop_back();

    return pn;
}

void ParseTree::cancelNary() noexcept {
    assert(!nary_start.empty());
    nary_construction_stack.resize(nary_start.back());
    nary_start.pop_back();
}

#ifndef NDEBUG
bool ParseTree::isNode(ParseNode pn) const noexcept {
    return created.find(pn) != created.end();
}

bool ParseTree::inFinalState() const noexcept {
    return nary_construction_stack.empty() && nary_start.empty();
}
#endif

template ParseNode ParseTree::arg<0>(ParseNode) const noexcept;
template ParseNode ParseTree::arg<1>(ParseNode) const noexcept;
template ParseNode ParseTree::addNode(Op, const std::array<ParseNode, 0>&, size_t) alloc_except;
template ParseNode ParseTree::addNode(Op, const std::array<ParseNode, 1>&, size_t) alloc_except;
template ParseNode ParseTree::addNode(Op, const std::array<ParseNode, 2>&, size_t) alloc_except;

}

}
