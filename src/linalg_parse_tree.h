#ifndef LINALG_PARSE_TREE_H
#define LINALG_PARSE_TREE_H

#include "linalg_builtins.h"
#include "linalg_common.h"
#include "linalg_parsenode_ops.h"
#include <array>
#include <string>
#include <vector>

#ifndef NDEBUG
#include <unordered_set>
#endif

namespace Linalg {

namespace Code {

class ParseTree {
public:
    ParseTree() noexcept;
    void clear() noexcept;
    bool empty() const noexcept;
    Op getOp(ParseNode pn) const noexcept;
    size_t getFlag(ParseNode pn) const noexcept;
    size_t getNumArgs(ParseNode pn) const noexcept;
    ParseNode arg(ParseNode pn, size_t index) const noexcept;
    template<size_t index> ParseNode arg(ParseNode pn) const noexcept;
    ParseNode lhs(ParseNode pn) const noexcept;
    ParseNode rhs(ParseNode pn) const noexcept;
    ParseNode child(ParseNode pn) const noexcept;
    double getDouble(ParseNode pn) const noexcept;
    char getPlaceholder(ParseNode pn) const noexcept;
    BuiltinId getBuiltin(ParseNode pn) const noexcept;
    size_t numNodes() const noexcept;
    std::string str(ParseNode pn) const alloc_except;
    std::string str() const alloc_except;
    bool equivalent(ParseNode pn, const ParseTree& other, ParseNode other_pn) const noexcept;
    bool equivalent(const ParseTree& other) const noexcept;

    template<size_t N> ParseNode addNode(Op type, const std::array<ParseNode, N>& children, size_t flag = 0) alloc_except;
    ParseNode addTerminal(Op type, size_t flag) alloc_except;
    ParseNode addPlaceholder(char name) alloc_except;
    ParseNode addConstant(double val) alloc_except;
    ParseNode addUnary(Op type, ParseNode child) alloc_except;
    ParseNode addBinary(Op type, ParseNode lhs, ParseNode rhs) alloc_except;

    void prepareNary() alloc_except;
    void addNaryChild(ParseNode pn) alloc_except;
    ParseNode finishNary(Op type, size_t flag) alloc_except;
    void cancelNary() noexcept;

    #ifndef NDEBUG
    bool isNode(ParseNode pn) const noexcept;
    bool inFinalState() const noexcept;
    #endif

    ParseNode root = NONE;

private:
    std::vector<size_t> data;
    std::vector<double> constants;
    std::vector<ParseNode> nary_construction_stack;
    std::vector<size_t> nary_start;
    size_t num_nodes = 0;

    #ifndef NDEBUG
    std::unordered_set<ParseNode> created;
    #endif

    static constexpr size_t OP_OFFSET = 0;
    static constexpr size_t FLAG_OFFSET = 1;
    static constexpr size_t NUM_ARGS_OFFSET = 2;
    static constexpr size_t FIXED_FIELDS = 3;

    ParseNode allocate(Op type, size_t flag, size_t num_args) alloc_except;
};

extern template ParseNode ParseTree::arg<0>(ParseNode) const noexcept;
extern template ParseNode ParseTree::arg<1>(ParseNode) const noexcept;
extern template ParseNode ParseTree::addNode(Op, const std::array<ParseNode, 0>&, size_t) alloc_except;
extern template ParseNode ParseTree::addNode(Op, const std::array<ParseNode, 1>&, size_t) alloc_except;
extern template ParseNode ParseTree::addNode(Op, const std::array<ParseNode, 2>&, size_t) alloc_except;

}

}

#endif // LINALG_PARSE_TREE_H
