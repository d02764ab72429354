// tests/unit/syntax/test_parser.cpp - Unit tests for the TypeScript parser
#include <gtest/gtest.h>

#include <iostream>
#include <string>

#include "purets/ast/ast.hpp"
#include "purets/test_support/parse_helpers.hpp"

using namespace purets;

namespace
{

void dump_diags(const ParsedUnit & unit)
{
  for (const auto & d : unit.diags.all()) {
    std::cerr << "diag: " << d.message << "\n";
  }
}

}  // namespace

TEST(SyntaxParser, ImportForms)
{
  auto unit = test_support::parse(R"(import def, { a, b as c, type T } from "./m.js";
import * as ns from "node:fs";
import type { U } from "./types.js";
import "./side.js";
)");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());
  ASSERT_EQ(unit->program->body.size(), 4u);

  const auto * first = dyn_cast<ImportDecl>(unit->program->body[0]);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->source, "./m.js");
  ASSERT_EQ(first->specifiers.size(), 4u);
  EXPECT_EQ(first->specifiers[0]->importKind, ImportKind::Default);
  EXPECT_EQ(first->specifiers[0]->local, "def");
  EXPECT_EQ(first->specifiers[2]->imported, "b");
  EXPECT_EQ(first->specifiers[2]->local, "c");
  EXPECT_TRUE(first->specifiers[3]->isTypeOnly);

  const auto * ns = dyn_cast<ImportDecl>(unit->program->body[1]);
  ASSERT_NE(ns, nullptr);
  ASSERT_EQ(ns->specifiers.size(), 1u);
  EXPECT_EQ(ns->specifiers[0]->importKind, ImportKind::Namespace);
  EXPECT_EQ(ns->specifiers[0]->local, "ns");

  const auto * type_only = dyn_cast<ImportDecl>(unit->program->body[2]);
  ASSERT_NE(type_only, nullptr);
  EXPECT_TRUE(type_only->isTypeOnly);

  const auto * bare = dyn_cast<ImportDecl>(unit->program->body[3]);
  ASSERT_NE(bare, nullptr);
  EXPECT_TRUE(bare->specifiers.empty());
}

TEST(SyntaxParser, ExportForms)
{
  auto unit = test_support::parse(R"(export function f(): void {}
export const x: number = 1;
export { x as y };
export { z } from "./z.js";
export * from "./all.js";
export * as ns from "./ns.js";
export default f;
)");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());
  const auto & body = unit->program->body;
  ASSERT_EQ(body.size(), 7u);

  const auto * fn = dyn_cast<ExportNamedDecl>(body[0]);
  ASSERT_NE(fn, nullptr);
  EXPECT_TRUE(isa<FunctionDecl>(fn->declaration));

  const auto * list = dyn_cast<ExportNamedDecl>(body[2]);
  ASSERT_NE(list, nullptr);
  EXPECT_EQ(list->declaration, nullptr);
  ASSERT_EQ(list->specifiers.size(), 1u);
  EXPECT_EQ(list->specifiers[0]->local, "x");
  EXPECT_EQ(list->specifiers[0]->exported, "y");
  EXPECT_FALSE(list->hasSource);

  const auto * from = dyn_cast<ExportNamedDecl>(body[3]);
  ASSERT_NE(from, nullptr);
  EXPECT_TRUE(from->hasSource);
  EXPECT_EQ(from->source, "./z.js");

  const auto * all = dyn_cast<ExportAllDecl>(body[4]);
  ASSERT_NE(all, nullptr);
  EXPECT_EQ(all->source, "./all.js");
  EXPECT_TRUE(all->alias.empty());

  const auto * aliased = dyn_cast<ExportAllDecl>(body[5]);
  ASSERT_NE(aliased, nullptr);
  EXPECT_EQ(aliased->alias, "ns");

  const auto * def = dyn_cast<ExportDefaultDecl>(body[6]);
  ASSERT_NE(def, nullptr);
  EXPECT_TRUE(isa<IdentifierExpr>(def->declaration));
}

TEST(SyntaxParser, FunctionDeclarations)
{
  auto unit = test_support::parse(R"(async function load(path: string, opts?: { n: number }): Promise<string> {
  return await read(path);
}
function* gen(): Generator<number> { yield 1; }
declare function ext(a: number): void;
)");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());
  const auto & body = unit->program->body;
  ASSERT_EQ(body.size(), 3u);

  const auto * load = dyn_cast<FunctionDecl>(body[0]);
  ASSERT_NE(load, nullptr);
  EXPECT_EQ(load->name, "load");
  EXPECT_TRUE(load->isAsync);
  ASSERT_EQ(load->params.size(), 2u);
  EXPECT_TRUE(load->params[1]->isOptional);
  EXPECT_NE(load->body, nullptr);

  const auto * gen = dyn_cast<FunctionDecl>(body[1]);
  ASSERT_NE(gen, nullptr);
  EXPECT_TRUE(gen->isGenerator);

  const auto * ext = dyn_cast<FunctionDecl>(body[2]);
  ASSERT_NE(ext, nullptr);
  EXPECT_TRUE(ext->isDeclare);
  EXPECT_EQ(ext->body, nullptr);
}

TEST(SyntaxParser, ArrowFunctionsAndOptionalChaining)
{
  auto unit = test_support::parse(R"(const f = async (a: number, b = 2): Promise<number> => a + b;
const g = x => x?.y?.[0] ?? null;
)");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());

  const auto * f = dyn_cast<VarDecl>(unit->program->body[0]);
  ASSERT_NE(f, nullptr);
  const auto * arrow = dyn_cast<ArrowFunctionExpr>(f->declarators[0]->init);
  ASSERT_NE(arrow, nullptr);
  EXPECT_TRUE(arrow->isAsync);
  EXPECT_EQ(arrow->params.size(), 2u);

  const auto * g = dyn_cast<VarDecl>(unit->program->body[1]);
  ASSERT_NE(g, nullptr);
  const auto * g_arrow = dyn_cast<ArrowFunctionExpr>(g->declarators[0]->init);
  ASSERT_NE(g_arrow, nullptr);
  EXPECT_EQ(g_arrow->params.size(), 1u);
}

TEST(SyntaxParser, BinaryPrecedence)
{
  auto unit = test_support::parse("const v = 1 + 2 * 3;\n");
  ASSERT_FALSE(unit->has_syntax_errors());

  const auto * decl = dyn_cast<VarDecl>(unit->program->body[0]);
  ASSERT_NE(decl, nullptr);
  const auto * add = dyn_cast<BinaryExpr>(decl->declarators[0]->init);
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, BinaryOp::Add);
  EXPECT_TRUE(isa<NumberLiteralExpr>(add->lhs));
  const auto * mul = dyn_cast<BinaryExpr>(add->rhs);
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOp::Mul);
}

TEST(SyntaxParser, ShiftIsCombinedFromAdjacentGreaterThan)
{
  auto unit = test_support::parse("const a: Array<Array<number>> = [];\nconst b = 8 >> 1;\n");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());

  const auto * b = dyn_cast<VarDecl>(unit->program->body[1]);
  ASSERT_NE(b, nullptr);
  const auto * shr = dyn_cast<BinaryExpr>(b->declarators[0]->init);
  ASSERT_NE(shr, nullptr);
  EXPECT_EQ(shr->op, BinaryOp::Shr);
}

TEST(SyntaxParser, TypeAnnotations)
{
  auto unit = test_support::parse(R"(type A = string | number[];
type B = readonly string[];
type C = { readonly [k: string]: number; f(x: number): void };
type D<T> = T extends (infer U)[] ? U : never;
type E = { [K in keyof A]?: A[K] };
type F = typeof console.log;
type G = [a: number, b?: string];
type H = (x: number) => x is 1;
)");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());
  ASSERT_EQ(unit->program->body.size(), 8u);

  const auto * a = dyn_cast<TypeAliasDecl>(unit->program->body[0]);
  ASSERT_NE(a, nullptr);
  const auto * u = dyn_cast<UnionType>(a->aliasedType);
  ASSERT_NE(u, nullptr);
  ASSERT_EQ(u->types.size(), 2u);
  EXPECT_TRUE(isa<ArrayType>(u->types[1]));

  const auto * b = dyn_cast<TypeAliasDecl>(unit->program->body[1]);
  ASSERT_NE(b, nullptr);
  const auto * op = dyn_cast<TypeOperator>(b->aliasedType);
  ASSERT_NE(op, nullptr);
  EXPECT_EQ(op->op, TypeOperatorKind::Readonly);

  const auto * d = dyn_cast<TypeAliasDecl>(unit->program->body[3]);
  ASSERT_NE(d, nullptr);
  EXPECT_TRUE(isa<ConditionalType>(d->aliasedType));

  const auto * e = dyn_cast<TypeAliasDecl>(unit->program->body[4]);
  ASSERT_NE(e, nullptr);
  EXPECT_TRUE(isa<MappedType>(e->aliasedType));
}

TEST(SyntaxParser, ClassesAndInterfaces)
{
  auto unit = test_support::parse(R"(class Box<T> extends Base implements Shape {
  private readonly value: T;
  static count = 0;
  constructor(private x: number) { super(); }
  get size(): number { return 1; }
  #secret = 1;
}
interface Point extends Base { x: number; y?: number }
enum Color { Red = 1, Green }
)");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());

  const auto * cls = dyn_cast<ClassDecl>(unit->program->body[0]);
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cls->name, "Box");
  EXPECT_TRUE(isa<IdentifierExpr>(cls->superClass));
  EXPECT_EQ(cls->implements.size(), 1u);
  ASSERT_EQ(cls->members.size(), 5u);
  EXPECT_EQ(cls->members[3]->memberKind, ClassMemberKind::Getter);

  const auto * iface = dyn_cast<InterfaceDecl>(unit->program->body[1]);
  ASSERT_NE(iface, nullptr);
  EXPECT_EQ(iface->extends.size(), 1u);
  EXPECT_EQ(iface->members.size(), 2u);

  const auto * en = dyn_cast<EnumDecl>(unit->program->body[2]);
  ASSERT_NE(en, nullptr);
  EXPECT_EQ(en->members.size(), 2u);
}

TEST(SyntaxParser, StatementsAndPatterns)
{
  auto unit = test_support::parse(R"(function f(xs: ReadonlyArray<number>): number {
  const { a, b: [c, ...rest] = [], ...others } = obj;
  for (let i = 0; i < 3; i++) { continue; }
  for (const x of xs) { }
  for (const k in obj) { }
  outer: while (a) { break outer; }
  try { g(); } catch { } finally { }
  switch (a) { case 1: break; default: { } }
  return a ? c : 0;
}
)");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());

  const auto * fn = dyn_cast<FunctionDecl>(unit->program->body[0]);
  ASSERT_NE(fn, nullptr);
  ASSERT_NE(fn->body, nullptr);
  ASSERT_EQ(fn->body->body.size(), 8u);
  EXPECT_TRUE(isa<VarDecl>(fn->body->body[0]));
  EXPECT_TRUE(isa<ForStmt>(fn->body->body[1]));
  EXPECT_TRUE(isa<ForOfStmt>(fn->body->body[2]));
  EXPECT_TRUE(isa<ForInStmt>(fn->body->body[3]));
  EXPECT_TRUE(isa<LabeledStmt>(fn->body->body[4]));
  EXPECT_TRUE(isa<TryStmt>(fn->body->body[5]));
  EXPECT_TRUE(isa<SwitchStmt>(fn->body->body[6]));
  EXPECT_TRUE(isa<ReturnStmt>(fn->body->body[7]));

  const auto * decl = cast<VarDecl>(fn->body->body[0]);
  EXPECT_TRUE(isa<ObjectPattern>(decl->declarators[0]->binding));
}

TEST(SyntaxParser, AutomaticSemicolonInsertion)
{
  auto unit = test_support::parse("const a = 1\nconst b = a\nlet c: number\nc = b\n");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());
  EXPECT_EQ(unit->program->body.size(), 4u);
}

TEST(SyntaxParser, ReturnFollowedByNewlineEndsStatement)
{
  auto unit = test_support::parse("function f(): void {\n  return\n  1;\n}\n");
  ASSERT_FALSE(unit->has_syntax_errors());
  const auto * fn = dyn_cast<FunctionDecl>(unit->program->body[0]);
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->body->body.size(), 2u);
  const auto * ret = dyn_cast<ReturnStmt>(fn->body->body[0]);
  ASSERT_NE(ret, nullptr);
  EXPECT_EQ(ret->value, nullptr);
}

TEST(SyntaxParser, CommentsAreRecorded)
{
  auto unit = test_support::parse("/** doc */\n// line\nconst a = 1; /* tail */\n");
  ASSERT_FALSE(unit->has_syntax_errors());
  ASSERT_EQ(unit->program->comments.size(), 3u);
  EXPECT_TRUE(unit->program->comments[0].isBlock);
  EXPECT_FALSE(unit->program->comments[1].isBlock);
}

TEST(SyntaxParser, RegexAndTemplateExpressions)
{
  auto unit = test_support::parse(
    "const r = /a+/g.test(s);\nconst t = `x${a + `y${b}`}z`;\nconst q = a / b / c;\n");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());

  const auto * t = dyn_cast<VarDecl>(unit->program->body[1]);
  ASSERT_NE(t, nullptr);
  const auto * tpl = dyn_cast<TemplateLiteralExpr>(t->declarators[0]->init);
  ASSERT_NE(tpl, nullptr);
  EXPECT_EQ(tpl->expressions.size(), 1u);
}

TEST(SyntaxParser, ErrorsAreReportedWithParseErrorCode)
{
  auto unit = test_support::parse("const = 1;\nfunction (\n");
  ASSERT_TRUE(unit->has_syntax_errors());
  for (const auto & d : unit->diags.all()) {
    EXPECT_EQ(d.code, "parse-error");
  }
}

TEST(SyntaxParser, RecoversAtNextStatement)
{
  auto unit = test_support::parse("const = 1;\nconst ok = 2;\n");
  ASSERT_TRUE(unit->has_syntax_errors());
  ASSERT_NE(unit->program, nullptr);

  bool saw_ok = false;
  for (const Stmt * s : unit->program->body) {
    const auto * v = dyn_cast<VarDecl>(s);
    if (!v || v->declarators.empty()) continue;
    if (const auto * b = dyn_cast<BindingIdent>(v->declarators[0]->binding); b && b->name == "ok") {
      saw_ok = true;
    }
  }
  EXPECT_TRUE(saw_ok);
}
