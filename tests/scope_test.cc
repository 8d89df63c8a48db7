#include <gtest/gtest.h>
#include "analysis/scope.h"

TEST(ScopeTest, DuplicateInSameScopeIsRejected)
{
    SymbolTable table;
    EXPECT_TRUE(table.declare("count", SymbolKind::VARIABLE));
    EXPECT_FALSE(table.declare("count", SymbolKind::CONSTANT));
    EXPECT_EQ(table.lookup("count")->kind, SymbolKind::VARIABLE);
}

TEST(ScopeTest, InnerScopeShadowsOuter)
{
    SymbolTable table;
    table.declare("x", SymbolKind::VARIABLE, "number");
    table.enter_scope(ScopeKind::BLOCK);
    EXPECT_EQ(table.depth(), 1);
    EXPECT_TRUE(table.declare("x", SymbolKind::SIGNAL_GETTER));
    EXPECT_TRUE(table.is_signal_getter("x"));

    table.exit_scope();
    EXPECT_EQ(table.depth(), 0);
    EXPECT_FALSE(table.is_signal_getter("x"));
    EXPECT_EQ(table.lookup("x")->inferred_type, "number");
}

TEST(ScopeTest, LookupWalksToEnclosingScopes)
{
    SymbolTable table;
    table.declare("App", SymbolKind::COMPONENT, "", 3, 1);
    table.enter_scope(ScopeKind::COMPONENT);
    table.enter_scope(ScopeKind::BLOCK);

    const Symbol* symbol = table.lookup("App");
    ASSERT_NE(symbol, nullptr);
    EXPECT_EQ(symbol->line, 3);
    EXPECT_EQ(table.lookup("missing"), nullptr);
    EXPECT_EQ(table.current_scope().kind, ScopeKind::BLOCK);
}

TEST(ScopeTest, GlobalScopeIsNeverLeft)
{
    SymbolTable table;
    table.exit_scope();
    table.exit_scope();
    EXPECT_EQ(table.depth(), 0);
    EXPECT_EQ(&table.current_scope(), &table.global_scope());
}

TEST(ScopeTest, MarkUsed)
{
    SymbolTable table;
    table.declare("setCount", SymbolKind::SIGNAL_SETTER);
    table.enter_scope(ScopeKind::FUNCTION);
    table.mark_used("setCount");
    table.mark_used("nothing");
    table.exit_scope();
    EXPECT_TRUE(table.lookup("setCount")->is_used);
}

TEST(ScopeTest, FlatViewKeepsMostRecentDeclaration)
{
    SymbolTable table;
    table.declare("v", SymbolKind::VARIABLE);
    table.enter_scope(ScopeKind::BLOCK);
    table.declare("v", SymbolKind::CONSTANT);
    table.exit_scope();

    ASSERT_EQ(table.globals().count("v"), 1u);
    EXPECT_EQ(table.globals().at("v")->kind, SymbolKind::CONSTANT);
    EXPECT_STREQ(symbol_kind_name(SymbolKind::SIGNAL_GETTER), "signal getter");
}
