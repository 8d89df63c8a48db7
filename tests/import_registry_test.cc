#include <gtest/gtest.h>
#include "codegen/import_registry.h"
#include "ir/ir.h"

namespace
{

const char* RUNTIME = "@pulsar-framework/pulsar.dev";

} // namespace

TEST(ImportRegistryTest, NamedImportsAreSortedAndDeduplicated)
{
    ImportRegistry registry;
    registry.add_named(RUNTIME, "t_element");
    registry.add_named(RUNTIME, "createSignal");
    registry.add_named(RUNTIME, "$REGISTRY");
    registry.add_named(RUNTIME, "createSignal");

    EXPECT_EQ(registry.generate(),
              "import { $REGISTRY, createSignal, t_element } from '@pulsar-framework/pulsar.dev';\n");
    EXPECT_EQ(registry.module_count(), 1u);
    EXPECT_TRUE(registry.has(RUNTIME, "createSignal"));
    EXPECT_FALSE(registry.has(RUNTIME, "createMemo"));
}

TEST(ImportRegistryTest, GenerationIsIdempotent)
{
    ImportRegistry registry;
    registry.add_named("b", "x");
    registry.add_named("a", "y");
    std::string first = registry.generate();
    EXPECT_EQ(first, registry.generate());
    EXPECT_EQ(first, "import { y } from 'a';\nimport { x } from 'b';\n");
}

TEST(ImportRegistryTest, AliasesDefaultsAndNamespaces)
{
    ImportRegistry registry;
    registry.add_default("react-ish", "Lib");
    registry.add_named("react-ish", "render", "draw");
    registry.add_namespace("./utils", "utils");

    EXPECT_EQ(registry.generate(),
              "import * as utils from './utils';\n"
              "import Lib, { render as draw } from 'react-ish';\n");
    EXPECT_TRUE(registry.has("react-ish", "Lib"));
}

TEST(ImportRegistryTest, TypeImportsAreSeparate)
{
    ImportRegistry registry;
    registry.add_named("./types", "IUser", "", true);
    registry.add_named("./types", "loadUser");
    EXPECT_EQ(registry.generate(),
              "import { loadUser } from './types';\n"
              "import type { IUser } from './types';\n");

    // A value import covers the type import of the same binding
    registry.add_named("./types", "IUser");
    registry.add_named("./types", "IUser", "", true);
    EXPECT_EQ(registry.generate(), "import { IUser, loadUser } from './types';\n");
}

TEST(ImportRegistryTest, SideEffectModulesComeFirst)
{
    ImportRegistry registry;
    registry.add_named("a", "x");
    registry.add_side_effect("./styles.css");
    EXPECT_EQ(registry.generate(), "import './styles.css';\nimport { x } from 'a';\n");
}

TEST(ImportRegistryTest, MergesImportStatements)
{
    ImportIR decl;
    decl.source = RUNTIME;
    ImportSpecifier spec;
    spec.imported = "createEffect";
    spec.local = "createEffect";
    decl.specifiers.push_back(spec);

    ImportRegistry registry;
    registry.add_named(RUNTIME, "t_element");
    registry.add(decl);
    EXPECT_EQ(registry.generate(), "import { createEffect, t_element } from '@pulsar-framework/pulsar.dev';\n");

    ImportIR side_effect;
    side_effect.source = "./polyfill";
    registry.add(side_effect);
    EXPECT_EQ(registry.module_count(), 2u);

    registry.clear();
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.generate(), "");
}

TEST(ImportRegistryTest, CommonJs)
{
    ImportRegistry registry;
    registry.add_named(RUNTIME, "createSignal");
    registry.add_named(RUNTIME, "signal", "s");
    registry.add_default("lib", "Lib");
    registry.add_namespace("ns-lib", "ns");
    registry.add_named("./types", "IUser", "", true);
    registry.add_side_effect("./polyfill");

    EXPECT_EQ(registry.generate(ModuleFormat::COMMONJS),
              "require('./polyfill');\n"
              "import type { IUser } from './types';\n"
              "const { createSignal, signal: s } = require('@pulsar-framework/pulsar.dev');\n"
              "const Lib = require('lib').default;\n"
              "const ns = require('ns-lib');\n");
}

TEST(ImportRegistryTest, ModuleFormatNames)
{
    ModuleFormat format = ModuleFormat::ESM;
    EXPECT_TRUE(parse_module_format("cjs", format));
    EXPECT_EQ(format, ModuleFormat::COMMONJS);
    EXPECT_TRUE(parse_module_format("esm", format));
    EXPECT_EQ(format, ModuleFormat::ESM);
    EXPECT_FALSE(parse_module_format("amd", format));
    EXPECT_STREQ(module_format_name(ModuleFormat::COMMONJS), "commonjs");
}
