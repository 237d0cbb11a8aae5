// schemaflow/sema/schema/schema_collector.cpp - Per-file schema declaration scan
#include "schemaflow/sema/schema/schema_collector.hpp"

#include <algorithm>
#include <array>

#include "schemaflow/basic/casting.hpp"
#include "schemaflow/syntax/parser.hpp"

namespace schemaflow
{

// ============================================================================
// Expression helpers
// ============================================================================

std::optional<std::string_view> string_literal_value(const Expr * expr) noexcept
{
  const auto * lit = dyn_cast<StringLiteralExpr>(expr);
  if (lit == nullptr || lit->is_bytes || lit->is_formatted) {
    return std::nullopt;
  }
  return lit->value;
}

std::string type_spelling(const Expr * expr)
{
  if (expr == nullptr) {
    return "Any";
  }
  std::string dotted;
  if (dotted_name(expr, dotted)) {
    return dotted;
  }
  if (auto s = string_literal_value(expr)) {
    return std::string(*s);
  }
  if (isa<NoneLiteralExpr>(expr)) {
    return "None";
  }
  if (const auto * sub = dyn_cast<SubscriptExpr>(expr)) {
    return type_spelling(sub->base);
  }
  return "Any";
}

const Argument * find_keyword(const CallExpr * call, std::string_view name) noexcept
{
  for (const auto * arg : call->args) {
    if (arg->is_keyword() && arg->name == name) {
      return arg;
    }
  }
  return nullptr;
}

const Expr * positional_arg(const CallExpr * call, size_t n) noexcept
{
  size_t seen = 0;
  for (const auto * arg : call->args) {
    if (!arg->is_positional()) {
      continue;
    }
    if (seen == n) {
      return arg->value;
    }
    ++seen;
  }
  return nullptr;
}

namespace
{

std::optional<bool> bool_literal(const Expr * expr) noexcept
{
  if (const auto * b = dyn_cast<BoolLiteralExpr>(expr)) {
    return b->value;
  }
  return std::nullopt;
}

/// Value of `name=<expr>`, falling back to the positional slot when given.
const Expr * argument(const CallExpr * call, std::string_view name, std::optional<size_t> slot)
{
  if (const auto * kw = find_keyword(call, name)) {
    return kw->value;
  }
  return slot ? positional_arg(call, *slot) : nullptr;
}

/// `ClassVar` or `ClassVar[...]`: class configuration, never a column.
bool is_class_var(const Expr * annotation) noexcept
{
  if (const auto * sub = dyn_cast<SubscriptExpr>(annotation)) {
    annotation = sub->base;
  }
  return terminal_name(annotation) == "ClassVar";
}

bool is_defined_later(const Expr * expr) noexcept { return terminal_name(expr) == "DefinedLater"; }

/// Strings and bare names listed in `[a, "b"]`, `("a", b)` or a single literal.
std::vector<std::string> member_names(const Expr * expr)
{
  std::vector<std::string> out;
  if (expr == nullptr) {
    return out;
  }
  if (auto s = string_literal_value(expr)) {
    out.emplace_back(*s);
    return out;
  }

  gsl::span<Expr * const> elements;
  if (const auto * list = dyn_cast<ListExpr>(expr)) {
    elements = list->elements;
  } else if (const auto * tuple = dyn_cast<TupleExpr>(expr)) {
    elements = tuple->elements;
  } else if (const auto * set = dyn_cast<SetExpr>(expr)) {
    elements = set->elements;
  }
  for (const auto * e : elements) {
    if (auto s = string_literal_value(e)) {
      out.emplace_back(*s);
    } else if (const auto * name = dyn_cast<NameExpr>(e)) {
      out.emplace_back(name->name);
    }
  }
  return out;
}

/// Selection entries of `A.select([A.x, "y"])`; attribute entries keep their attribute name.
std::vector<NamedRef> selection_refs(const CallExpr * call)
{
  std::vector<NamedRef> out;
  auto add = [&](const Expr * e) {
    if (auto s = string_literal_value(e)) {
      out.push_back({std::string(*s), e->get_range()});
    } else if (const auto * attr = dyn_cast<AttributeExpr>(e)) {
      out.push_back({std::string(attr->attr), attr->attr_range});
    } else if (const auto * name = dyn_cast<NameExpr>(e)) {
      out.push_back({std::string(name->name), name->get_range()});
    }
  };

  for (const auto * arg : call->args) {
    if (!arg->is_positional() && !(arg->is_keyword() && arg->name == "columns")) {
      continue;
    }
    if (const auto * list = dyn_cast<ListExpr>(arg->value)) {
      for (const auto * e : list->elements) {
        add(e);
      }
    } else if (const auto * tuple = dyn_cast<TupleExpr>(arg->value)) {
      for (const auto * e : tuple->elements) {
        add(e);
      }
    } else {
      add(arg->value);
    }
  }
  return out;
}

/// Flatten `A + B + C` into its Name leaves; false if any leaf is not a Name.
bool flatten_sum(const Expr * expr, std::vector<NamedRef> & out)
{
  if (const auto * bin = dyn_cast<BinaryExpr>(expr)) {
    return bin->op == BinaryOp::Add && flatten_sum(bin->lhs, out) && flatten_sum(bin->rhs, out);
  }
  if (const auto * name = dyn_cast<NameExpr>(expr)) {
    out.push_back({std::string(name->name), name->get_range()});
    return true;
  }
  return false;
}

}  // namespace

// ============================================================================
// SchemaCollector
// ============================================================================

bool SchemaCollector::is_schema_root(std::string_view name) noexcept
{
  static constexpr std::array<std::string_view, 4> k_roots = {
    "BaseSchema", "DataFrameModel", "SchemaModel", "BaseFrame"};
  for (const auto r : k_roots) {
    if (r == name) {
      return true;
    }
  }
  return false;
}

CollectedSchemas SchemaCollector::collect(const Module & module)
{
  CollectedSchemas out;
  out.file_id = file_id_;

  for (const auto * stmt : module.body) {
    if (const auto * cls = dyn_cast<ClassDefStmt>(stmt)) {
      collect_class(cls, out.candidates);
    } else if (const auto * assign = dyn_cast<AssignStmt>(stmt)) {
      collect_assignment(assign, out.candidates);
    }
  }
  return out;
}

void SchemaCollector::collect_class(const ClassDefStmt * cls, std::vector<RawSchema> & out)
{
  RawSchema schema;
  schema.kind = CandidateKind::Class;
  schema.name = std::string(cls->name);
  schema.declared_at = cls->name_range;

  for (const auto * base : cls->bases) {
    if (!base->is_positional()) {
      continue;
    }
    const std::string_view terminal = terminal_name(base->value);
    if (!terminal.empty()) {
      schema.operands.push_back({std::string(terminal), base->value->get_range()});
    }
  }
  // Only classes with a Name/Attribute base can be schemas.
  if (schema.operands.empty()) {
    return;
  }

  bool saw_descriptor = false;
  bool saw_annotation = false;

  for (const auto * stmt : cls->body) {
    if (const auto * assign = dyn_cast<AssignStmt>(stmt)) {
      if (assign->targets.size() != 1) {
        continue;
      }
      const auto * target = dyn_cast<NameExpr>(assign->targets[0]);
      if (target == nullptr) {
        continue;
      }
      if (target->name == "allow_extra_columns") {
        if (auto b = bool_literal(assign->value)) {
          schema.allow_extra_columns = *b;
        }
        continue;
      }
      if (const auto * call = dyn_cast<CallExpr>(assign->value)) {
        const std::string_view callee = terminal_name(call->callee);
        if (callee == "Column" || callee == "ColumnSet" || callee == "ColumnGroup") {
          collect_descriptor(schema, target, call, nullptr);
          saw_descriptor = true;
        }
      }
      continue;
    }

    if (const auto * ann = dyn_cast<AnnAssignStmt>(stmt)) {
      const auto * target = dyn_cast<NameExpr>(ann->target);
      if (target == nullptr) {
        continue;
      }
      if (target->name == "allow_extra_columns") {
        if (auto b = bool_literal(ann->value)) {
          schema.allow_extra_columns = *b;
        }
        continue;
      }

      if (is_class_var(ann->annotation)) {
        continue;
      }

      const auto * call = dyn_cast<CallExpr>(ann->value);
      const std::string_view callee = call ? terminal_name(call->callee) : std::string_view{};
      if (callee == "Column" || callee == "ColumnSet" || callee == "ColumnGroup") {
        collect_descriptor(schema, target, call, ann->annotation);
        saw_descriptor = true;
      } else {
        collect_annotated_field(schema, target, ann->annotation, ann->value);
        saw_annotation = true;
      }
      continue;
    }

    if (const auto * nested = dyn_cast<ClassDefStmt>(stmt)) {
      if (nested->name == "Config") {
        collect_config_class(schema, nested);
      }
    }
  }

  if (saw_descriptor) {
    schema.style = DeclarationStyle::DescriptorClass;
  } else if (saw_annotation) {
    schema.style = DeclarationStyle::AnnotatedFieldClass;
  }
  out.push_back(std::move(schema));
}

void SchemaCollector::collect_descriptor(
  RawSchema & schema, const NameExpr * target, const CallExpr * call, const Expr * annotation)
{
  const std::string name(target->name);
  if (!name.empty() && name.front() == '_') {
    return;
  }
  const std::string_view callee = terminal_name(call->callee);

  if (callee == "ColumnGroup") {
    ColumnGroup group;
    group.name = name;
    group.members = member_names(argument(call, "members", 0));
    group.declared_at = target->get_range();
    schema.groups.erase(
      std::remove_if(
        schema.groups.begin(), schema.groups.end(),
        [&](const ColumnGroup & g) { return g.name == name; }),
      schema.groups.end());
    schema.groups.push_back(std::move(group));
    return;
  }

  ColumnDefinition column;
  column.name = name;
  column.lookup_key = name;
  column.declared_at = target->get_range();

  // Column's first positional argument is its type; ColumnSet's is its members.
  std::optional<size_t> type_slot;
  if (callee == "Column") {
    type_slot = 0;
  }
  const Expr * type_expr = argument(call, "type", type_slot);
  if (type_expr == nullptr && annotation != nullptr) {
    bool nullable = false;
    type_expr = unwrap_annotation(annotation, nullable);
    column.nullable = nullable;
  }
  column.value_type = ValueType::from_spelling(type_spelling(type_expr));

  if (auto nullable = bool_literal(argument(call, "nullable", std::nullopt))) {
    column.nullable = *nullable;
  }

  if (callee == "Column") {
    const Expr * alias = argument(call, "alias", std::nullopt);
    if (auto s = string_literal_value(alias)) {
      column.lookup_key = std::string(*s);
    }
    // `alias=DefinedLater` keeps the attribute name as the physical name.
  } else {
    const Expr * members = argument(call, "members", 0);
    const Expr * regex = argument(call, "regex", std::nullopt);
    const auto regex_flag = bool_literal(regex);
    const auto regex_text = string_literal_value(regex);

    std::vector<std::string> patterns;
    if (regex_text) {
      patterns.emplace_back(*regex_text);
    } else if (regex_flag.value_or(false)) {
      patterns = member_names(members);
    }

    if (!patterns.empty()) {
      RegexMember rx;
      const SourceRange at = regex_text ? regex->get_range() : get_range(members);
      for (auto & p : patterns) {
        std::string error;
        auto compiled = compile_column_pattern(p, error);
        if (!compiled) {
          schema.pattern_issues.push_back(
            {at, "Invalid column pattern '" + p + "' in " + schema.name + "." + name + ": " + error});
        }
        rx.compiled.push_back(std::move(compiled));
        rx.patterns.push_back(std::move(p));
      }
      column.membership = std::move(rx);
    } else if (members != nullptr && is_defined_later(members)) {
      column.membership = DeferredMembers{};
    } else {
      column.membership = MembersList{member_names(members)};
    }
  }

  schema.columns.erase(
    std::remove_if(
      schema.columns.begin(), schema.columns.end(),
      [&](const ColumnDefinition & c) { return c.name == name; }),
    schema.columns.end());
  schema.columns.push_back(std::move(column));
}

void SchemaCollector::collect_annotated_field(
  RawSchema & schema, const NameExpr * target, const Expr * annotation, const Expr * value)
{
  const std::string name(target->name);
  if (!name.empty() && name.front() == '_') {
    return;
  }

  ColumnDefinition column;
  column.name = name;
  column.lookup_key = name;
  column.declared_at = target->get_range();

  bool nullable = false;
  const Expr * type_expr = unwrap_annotation(annotation, nullable);
  column.value_type = ValueType::from_spelling(type_spelling(type_expr));
  column.nullable = nullable;

  // `= Field(alias="x", nullable=True)` (pandera style)
  if (const auto * call = dyn_cast<CallExpr>(value)) {
    if (terminal_name(call->callee) == "Field") {
      if (auto s = string_literal_value(argument(call, "alias", std::nullopt))) {
        column.lookup_key = std::string(*s);
      }
      if (auto b = bool_literal(argument(call, "nullable", std::nullopt))) {
        column.nullable = *b;
      }
    }
  }

  schema.columns.erase(
    std::remove_if(
      schema.columns.begin(), schema.columns.end(),
      [&](const ColumnDefinition & c) { return c.name == name; }),
    schema.columns.end());
  schema.columns.push_back(std::move(column));
}

void SchemaCollector::collect_config_class(RawSchema & schema, const ClassDefStmt * config)
{
  for (const auto * stmt : config->body) {
    const auto * assign = dyn_cast<AssignStmt>(stmt);
    if (assign == nullptr || assign->targets.size() != 1) {
      continue;
    }
    const auto * target = dyn_cast<NameExpr>(assign->targets[0]);
    if (target != nullptr && target->name == "strict") {
      if (auto b = bool_literal(assign->value)) {
        schema.allow_extra_columns = !*b;
      }
    }
  }
}

const Expr * SchemaCollector::unwrap_annotation(const Expr * annotation, bool & nullable)
{
  const Expr * expr = annotation;
  // Bounded: each step strictly descends into a child expression.
  while (expr != nullptr) {
    if (const auto * lit = dyn_cast<StringLiteralExpr>(expr)) {
      if (lit->is_bytes || lit->is_formatted) {
        return expr;
      }
      const uint32_t offset = lit->get_range().get_begin().offset() + 1;
      const Expr * reparsed = syntax::parse_expression_text(ast_, file_id_, lit->value, offset);
      if (reparsed == nullptr || isa<StringLiteralExpr>(reparsed)) {
        return expr;
      }
      expr = reparsed;
      continue;
    }

    if (const auto * bin = dyn_cast<BinaryExpr>(expr)) {
      if (bin->op != BinaryOp::BitOr) {
        return expr;
      }
      if (isa<NoneLiteralExpr>(bin->rhs)) {
        nullable = true;
        expr = bin->lhs;
        continue;
      }
      if (isa<NoneLiteralExpr>(bin->lhs)) {
        nullable = true;
        expr = bin->rhs;
        continue;
      }
      return expr;
    }

    const auto * sub = dyn_cast<SubscriptExpr>(expr);
    if (sub == nullptr) {
      return expr;
    }
    const std::string_view wrapper = terminal_name(sub->base);
    const auto * tuple = dyn_cast<TupleExpr>(sub->index);

    if (wrapper == "Optional") {
      nullable = true;
      expr = sub->index;
    } else if (wrapper == "Series" || wrapper == "Annotated" || wrapper == "Column") {
      expr = (tuple != nullptr && !tuple->elements.empty()) ? tuple->elements[0] : sub->index;
    } else if (wrapper == "Union" && tuple != nullptr) {
      const Expr * chosen = nullptr;
      for (const auto * e : tuple->elements) {
        if (isa<NoneLiteralExpr>(e)) {
          nullable = true;
        } else if (chosen == nullptr) {
          chosen = e;
        }
      }
      if (chosen == nullptr) {
        return expr;
      }
      expr = chosen;
    } else {
      return expr;
    }
  }
  return expr;
}

// ============================================================================
// Module-level expressions
// ============================================================================

void SchemaCollector::collect_assignment(const AssignStmt * assign, std::vector<RawSchema> & out)
{
  if (assign->targets.size() != 1) {
    return;
  }
  const auto * target = dyn_cast<NameExpr>(assign->targets[0]);
  if (target == nullptr) {
    return;
  }

  RawSchema schema;
  schema.name = std::string(target->name);
  schema.declared_at = target->get_range();

  // S = A + B (+ ...)
  if (const auto * bin = dyn_cast<BinaryExpr>(assign->value)) {
    if (bin->op != BinaryOp::Add || !flatten_sum(bin, schema.operands)) {
      return;
    }
    schema.kind = CandidateKind::Add;
    schema.style = DeclarationStyle::AddExpression;
    out.push_back(std::move(schema));
    return;
  }

  const auto * call = dyn_cast<CallExpr>(assign->value);
  if (call == nullptr) {
    return;
  }

  // S = combine_schemas(A, B, ...)
  if (terminal_name(call->callee) == "combine_schemas") {
    for (const auto * arg : call->args) {
      if (!arg->is_positional()) {
        continue;
      }
      const auto * name = dyn_cast<NameExpr>(arg->value);
      if (name == nullptr) {
        return;
      }
      schema.operands.push_back({std::string(name->name), name->get_range()});
    }
    if (schema.operands.size() < 2) {
      return;
    }
    schema.kind = CandidateKind::Add;
    schema.style = DeclarationStyle::AddExpression;
    out.push_back(std::move(schema));
    return;
  }

  // S = A.select([...]) / S = A.drop([...])
  const auto * method = dyn_cast<AttributeExpr>(call->callee);
  if (method == nullptr || (method->attr != "select" && method->attr != "drop")) {
    return;
  }
  const auto * source = dyn_cast<NameExpr>(method->base);
  if (source == nullptr) {
    return;
  }
  schema.operands.push_back({std::string(source->name), source->get_range()});
  schema.selection = selection_refs(call);
  if (method->attr == "select") {
    schema.kind = CandidateKind::Subset;
    schema.style = DeclarationStyle::SubsetExpression;
  } else {
    schema.kind = CandidateKind::Drop;
    schema.style = DeclarationStyle::DropExpression;
  }
  out.push_back(std::move(schema));
}

}  // namespace schemaflow
