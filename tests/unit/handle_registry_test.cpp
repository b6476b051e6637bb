#include "jos/jos_errors.h"
#include "jos/jos_handle_registry.h"
#include "stream_builder.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace ykr::jos;
using ykr::test::handle;

TEST(HandleRegistryTest, AllocatesFromBaseWireHandle) {
    HandleRegistry reg;
    EXPECT_EQ(reg.next_handle(), 0x7E0000);
    EXPECT_EQ(reg.allocate(), 0x7E0000);
    EXPECT_EQ(reg.allocate(), 0x7E0001);
    EXPECT_EQ(reg.allocate(), 0x7E0002);
    EXPECT_EQ(reg.next_handle(), 0x7E0003);
    EXPECT_EQ(reg.size(), 0u);
}

TEST(HandleRegistryTest, StoreAndResolve) {
    HandleRegistry reg;
    const Handle h = reg.allocate();
    reg.store(h, StringRecord{h, "hello"});

    EXPECT_TRUE(reg.contains(h));
    EXPECT_FALSE(reg.is_pending(h));
    EXPECT_EQ(reg.resolve_string(h).value, "hello");
    EXPECT_EQ(handle_of(reg.resolve(h)), h);
}

TEST(HandleRegistryTest, UnknownHandleIsDangling) {
    HandleRegistry reg;
    EXPECT_THROW(reg.resolve(handle(0)), DanglingReferenceError);
    EXPECT_THROW(reg.resolve(42), DanglingReferenceError);
}

TEST(HandleRegistryTest, PendingHandleIsDangling) {
    HandleRegistry reg;
    const Handle h = reg.allocate();
    EXPECT_TRUE(reg.is_pending(h));
    try {
        reg.resolve(h);
        FAIL() << "expected DanglingReferenceError";
    } catch (const DanglingReferenceError& e) {
        EXPECT_NE(std::string(e.what()).find("still being decoded"), std::string::npos);
    }
}

TEST(HandleRegistryTest, WrongKindIsProtocolError) {
    HandleRegistry reg;
    const Handle h = reg.allocate();
    reg.store(h, StringRecord{h, "x"});
    EXPECT_THROW(reg.resolve_class_desc(h), ProtocolError);

    const Handle c = reg.allocate();
    ClassDescRecord rec{};
    rec.handle = c;
    rec.desc.class_name = "Foo";
    reg.store(c, rec);
    EXPECT_THROW(reg.resolve_string(c), ProtocolError);
    EXPECT_EQ(reg.resolve_class_desc(c).desc.class_name, "Foo");
}

TEST(HandleRegistryTest, StoringTwiceIsALogicError) {
    HandleRegistry reg;
    const Handle h = reg.allocate();
    reg.store(h, StringRecord{h, "a"});
    EXPECT_THROW(reg.store(h, StringRecord{h, "b"}), std::logic_error);
    EXPECT_EQ(reg.resolve_string(h).value, "a");
}

TEST(HandleRegistryTest, StoringUnallocatedHandleIsALogicError) {
    HandleRegistry reg;
    EXPECT_THROW(reg.store(handle(0), StringRecord{handle(0), "a"}), std::logic_error);

    const Handle h = reg.allocate();
    EXPECT_THROW(reg.store(h, StringRecord{h + 1, "a"}), std::logic_error);
}
