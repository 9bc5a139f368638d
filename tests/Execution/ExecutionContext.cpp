/// @file ExecutionContext.cpp
/// @brief Tests for Tether::Execution::ExecutionContext and ContextScope.

#include <Tether/Execution/ExecutionContext.hpp>
#include <Tether/Locals/ContextLocal.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace Tether::Execution
{
    TEST_CASE("ContextScope installs and restores the current context", "[Execution][ExecutionContext]")
    {
        ExecutionContext& threadContext = ExecutionContext::Current();
        ExecutionContext  outer;
        ExecutionContext  inner;

        {
            ContextScope outerScope(outer);
            CHECK(&ExecutionContext::Current() == &outer);
            {
                ContextScope innerScope(inner);
                CHECK(&ExecutionContext::Current() == &inner);
            }
            CHECK(&ExecutionContext::Current() == &outer);
        }
        CHECK(&ExecutionContext::Current() == &threadContext);
    }

    TEST_CASE("ExecutionContext creates stores on demand", "[Execution][ExecutionContext]")
    {
        ExecutionContext context;
        CHECK(context.FindStore(StoreKind::Primary) == nullptr);
        CHECK(context.FindStore(StoreKind::Inheritable) == nullptr);

        auto& primary = context.EnsureStore(StoreKind::Primary);
        CHECK(context.FindStore(StoreKind::Primary) == &primary);
        CHECK(&context.EnsureStore(StoreKind::Primary) == &primary);
        CHECK(context.FindStore(StoreKind::Inheritable) == nullptr);

        const ExecutionContext& view = context;
        CHECK(view.FindStore(StoreKind::Primary) == &primary);
    }

    TEST_CASE("ExecutionContext snapshot without an inheritable store is null", "[Execution][ExecutionContext]")
    {
        ExecutionContext parent;
        parent.EnsureStore(StoreKind::Primary);
        CHECK_FALSE(parent.SnapshotInheritable());

        ExecutionContext child;
        child.EnsureStore(StoreKind::Inheritable);
        child.InheritFrom(parent);
        CHECK(child.FindStore(StoreKind::Inheritable) == nullptr);
    }

    TEST_CASE("ExecutionContext inherited stores are independent", "[Execution][ExecutionContext]")
    {
        Locals::InheritableContextLocal<std::string> tenant;
        ExecutionContext                             parent;
        tenant.Set(parent, "acme");

        ExecutionContext child;
        child.InheritFrom(parent);
        REQUIRE(child.FindStore(StoreKind::Inheritable) != nullptr);
        CHECK(child.FindStore(StoreKind::Inheritable) != parent.FindStore(StoreKind::Inheritable));
        CHECK(tenant.Get(child) == "acme");

        tenant.Set(child, "globex");
        CHECK(tenant.Get(parent) == "acme");

        tenant.Remove(parent);
        CHECK(tenant.Get(child) == "globex");
    }

    TEST_CASE("ExecutionContext reset drops every value", "[Execution][ExecutionContext]")
    {
        Locals::ContextLocal<int>            primary;
        Locals::InheritableContextLocal<int> inheritable;
        ExecutionContext                     context;

        primary.Set(context, 1);
        inheritable.Set(context, 2);
        context.Reset();

        CHECK(context.FindStore(StoreKind::Primary) == nullptr);
        CHECK(context.FindStore(StoreKind::Inheritable) == nullptr);
        CHECK(primary.Get(context) == 0);
    }
}// namespace Tether::Execution
