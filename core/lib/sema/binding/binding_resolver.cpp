// schemaflow/sema/binding/binding_resolver.cpp - Schema binding resolution
#include "schemaflow/sema/binding/binding_resolver.hpp"

#include <algorithm>
#include <memory>
#include <utility>

#include "schemaflow/basic/casting.hpp"
#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/sema/binding/frame_patterns.hpp"
#include "schemaflow/sema/schema/schema_collector.hpp"

namespace schemaflow
{

namespace
{

std::string join(const std::vector<std::string> & names, std::string_view sep)
{
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i != 0) {
      out.append(sep);
    }
    out.append(names[i]);
  }
  return out;
}

/// `drop(index=...)`, `drop(..., axis=0)` and `drop(..., axis="index")` remove rows.
bool drops_rows(const CallExpr * call)
{
  if (find_keyword(call, "index") != nullptr && find_keyword(call, "columns") == nullptr) {
    return true;
  }
  const Argument * axis = find_keyword(call, "axis");
  if (axis == nullptr) {
    return false;
  }
  if (const auto * lit = dyn_cast<IntLiteralExpr>(axis->value)) {
    return lit->text == "0";
  }
  if (auto s = string_literal_value(axis->value)) {
    return *s == "index" || *s == "rows";
  }
  return false;
}

/// First positional argument, or the keyword form of it.
const Expr * operand(const CallExpr * call, size_t slot, std::string_view keyword)
{
  if (const Expr * e = positional_arg(call, slot)) {
    return e;
  }
  const Argument * kw = find_keyword(call, keyword);
  return kw != nullptr ? kw->value : nullptr;
}

/// Frames listed in `concat([a, b])` / `concat(objs=[a, b])`.
std::vector<const Expr *> concat_operands(const CallExpr * call)
{
  std::vector<const Expr *> out;
  const Expr * objs = operand(call, 0, "objs");
  if (objs == nullptr) {
    objs = operand(call, 0, "items");
  }
  gsl::span<Expr * const> elements;
  if (const auto * list = dyn_cast<ListExpr>(objs)) {
    elements = list->elements;
  } else if (const auto * tuple = dyn_cast<TupleExpr>(objs)) {
    elements = tuple->elements;
  }
  out.assign(elements.begin(), elements.end());
  return out;
}

/// Names a case pattern captures; `_` binds nothing.
void pattern_captures(const Expr * pattern, std::vector<std::string_view> & out)
{
  if (const auto * name = dyn_cast<NameExpr>(pattern)) {
    if (name->name != "_") {
      out.push_back(name->name);
    }
  } else if (const auto * as = dyn_cast<AsPatternExpr>(pattern)) {
    pattern_captures(as->pattern, out);
    out.push_back(as->target->name);
  } else if (const auto * star = dyn_cast<StarredExpr>(pattern)) {
    pattern_captures(star->value, out);
  } else if (const auto * list = dyn_cast<ListExpr>(pattern)) {
    for (const auto * e : list->elements) {
      pattern_captures(e, out);
    }
  } else if (const auto * tuple = dyn_cast<TupleExpr>(pattern)) {
    for (const auto * e : tuple->elements) {
      pattern_captures(e, out);
    }
  } else if (const auto * mapping = dyn_cast<DictExpr>(pattern)) {
    for (const auto * v : mapping->values) {
      pattern_captures(v, out);
    }
  } else if (const auto * cls = dyn_cast<CallExpr>(pattern)) {
    for (const auto * arg : cls->args) {
      pattern_captures(arg->value, out);
    }
  } else if (const auto * alt = dyn_cast<BinaryExpr>(pattern)) {
    if (alt->op == BinaryOp::BitOr) {
      pattern_captures(alt->lhs, out);
      pattern_captures(alt->rhs, out);
    }
  }
}

/// A capture or wildcard, possibly under `as` or `|`, matches every subject.
bool is_irrefutable(const Expr * pattern)
{
  if (isa<NameExpr>(pattern)) {
    return true;
  }
  if (const auto * as = dyn_cast<AsPatternExpr>(pattern)) {
    return is_irrefutable(as->pattern);
  }
  if (const auto * alt = dyn_cast<BinaryExpr>(pattern)) {
    return alt->op == BinaryOp::BitOr && (is_irrefutable(alt->lhs) || is_irrefutable(alt->rhs));
  }
  return false;
}

}  // namespace

std::string describe_frame_expr(const Expr * expr)
{
  std::string out;
  if (dotted_name(expr, out)) {
    return out;
  }
  if (const auto * call = dyn_cast<CallExpr>(expr)) {
    return describe_frame_expr(call->callee) + "()";
  }
  if (const auto * sub = dyn_cast<SubscriptExpr>(expr)) {
    return describe_frame_expr(sub->base) + "[...]";
  }
  if (const auto * attr = dyn_cast<AttributeExpr>(expr)) {
    return describe_frame_expr(attr->base) + "." + std::string(attr->attr);
  }
  return "<expression>";
}

// ============================================================================
// Construction / Entry Point
// ============================================================================

BindingResolver::BindingResolver(
  const SchemaRegistry & registry, AstContext & ast, FileId file_id, AccessSink & sink)
: registry_(registry), ast_(ast), file_id_(file_id), sink_(sink)
{
  if (!registry_.is_frozen()) {
    throw InternalFault("binding resolution started before the schema registry was frozen");
  }
}

void BindingResolver::run(const Module & module)
{
  if (module_scope_ != nullptr) {
    throw InternalFault("binding resolver reused for a second module");
  }

  BindingScope & module_scope = env_.create_scope("", nullptr);
  scope_ = &module_scope;
  module_scope_ = &module_scope;
  function_parent_ = &module_scope;

  collect_function_returns(module);
  visit_body(module.body);

  // Function bodies see the final state of their enclosing scope.
  while (!pending_.empty()) {
    PendingBody next = std::move(pending_.front());
    pending_.pop_front();
    run_function(next);
  }
}

const BindingScope * BindingResolver::function_scope(std::string_view qualifier) const
{
  const auto it = function_scopes_.find(qualifier);
  return it != function_scopes_.end() ? it->second : nullptr;
}

void BindingResolver::collect_function_returns(const Module & module)
{
  for (const auto * stmt : module.body) {
    const auto * fn = dyn_cast<FunctionDefStmt>(stmt);
    if (fn == nullptr || fn->returns == nullptr) {
      continue;
    }
    if (const SchemaDefinition * schema = annotation_schema(fn->returns)) {
      function_returns_.insert_or_assign(fn->name, schema);
    } else {
      function_returns_.erase(fn->name);
    }
  }
}

void BindingResolver::run_function(const PendingBody & pending)
{
  BindingScope & scope = env_.create_scope(pending.qualifier, pending.parent);
  scope_ = &scope;
  function_parent_ = &scope;

  for (const auto * param : pending.function->params) {
    if (param->name.empty()) {
      continue;
    }
    const SchemaBinding b = bound_to(annotation_schema(param->annotation), Confidence::Certain);
    scope.bind(param->name, b.schema, b.confidence);
  }

  visit_body(pending.function->body);
  function_scopes_.insert_or_assign(pending.qualifier, &scope);
}

void BindingResolver::visit_body(gsl::span<Stmt *> body)
{
  for (const auto * stmt : body) {
    visit(stmt);
  }
}

std::string BindingResolver::qualify(std::string_view name) const
{
  if (scope_->qualifier().empty()) {
    return std::string(name);
  }
  return scope_->qualifier() + "." + std::string(name);
}

void BindingResolver::merge_outcomes(const std::vector<BindingScope::Table> & outcomes)
{
  if (outcomes.empty()) {
    return;
  }
  if (outcomes.size() == 1) {
    scope_->restore(outcomes.front());
    return;
  }
  BindingScope::Table acc = outcomes.front();
  for (size_t i = 1; i < outcomes.size(); ++i) {
    scope_->merge(acc, outcomes[i]);
    acc = scope_->snapshot();
  }
}

// ============================================================================
// Schema lookup
// ============================================================================

const SchemaDefinition * BindingResolver::schema_named(const Expr * expr) const
{
  if (!isa<NameExpr>(expr) && !isa<AttributeExpr>(expr)) {
    return nullptr;
  }
  const std::string_view name = terminal_name(expr);
  return name.empty() ? nullptr : registry_.find(name);
}

const SchemaDefinition * BindingResolver::annotation_schema(const Expr * annotation)
{
  if (annotation == nullptr) {
    return nullptr;
  }
  return schema_named(annotated_schema_expr(ast_, file_id_, annotation));
}

SchemaBinding BindingResolver::bound_to(const SchemaDefinition * schema, Confidence c)
{
  SchemaBinding b;
  if (schema != nullptr && schema->resolved) {
    b.schema = schema;
    b.confidence = c;
  }
  return b;
}

bool BindingResolver::column_names(const Expr * expr, std::vector<std::string> & out) const
{
  if (auto s = string_literal_value(expr)) {
    out.emplace_back(*s);
    return true;
  }
  if (const auto * attr = dyn_cast<AttributeExpr>(expr)) {
    const SchemaDefinition * other = schema_named(attr->base);
    if (other == nullptr) {
      return false;
    }
    const ColumnDefinition * col = other->find_by_name(attr->attr);
    out.emplace_back(col != nullptr && col->is_exact() ? col->lookup_key : std::string(attr->attr));
    return true;
  }

  gsl::span<Expr * const> elements;
  if (const auto * list = dyn_cast<ListExpr>(expr)) {
    elements = list->elements;
  } else if (const auto * tuple = dyn_cast<TupleExpr>(expr)) {
    elements = tuple->elements;
  } else {
    return false;
  }
  for (const auto * e : elements) {
    if (isa<ListExpr>(e) || isa<TupleExpr>(e) || !column_names(e, out)) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// Inference
// ============================================================================

SchemaBinding BindingResolver::infer(const Expr * expr)
{
  if (const auto * name = dyn_cast<NameExpr>(expr)) {
    if (const SchemaBinding * b = scope_->lookup(name->name)) {
      return *b;
    }
    return SchemaBinding::unknown();
  }
  if (const auto * call = dyn_cast<CallExpr>(expr)) {
    return infer_call(call);
  }
  if (const auto * sub = dyn_cast<SubscriptExpr>(expr)) {
    return infer_subscript(sub);
  }
  if (const auto * await = dyn_cast<AwaitExpr>(expr)) {
    return infer(await->value);
  }
  if (const auto * named = dyn_cast<NamedExpr>(expr)) {
    return infer(named->value);
  }
  if (const auto * cond = dyn_cast<ConditionalExpr>(expr)) {
    const SchemaBinding then_b = infer(cond->then_expr);
    const SchemaBinding else_b = infer(cond->else_expr);
    if (!then_b.is_unknown() && then_b.schema == else_b.schema) {
      return bound_to(then_b.schema, Confidence::Inferred);
    }
  }
  return SchemaBinding::unknown();
}

SchemaBinding BindingResolver::infer_call(const CallExpr * call)
{
  // load(path, schema=S)
  if (const Argument * kw = find_keyword(call, "schema")) {
    if (const SchemaDefinition * s = schema_named(kw->value)) {
      return bound_to(s, Confidence::Certain);
    }
  }

  // DataFrame[S](...)
  if (const auto * sub = dyn_cast<SubscriptExpr>(call->callee)) {
    if (is_frame_generic_name(terminal_name(sub->base))) {
      return bound_to(schema_named(sub->index), Confidence::Certain);
    }
    return SchemaBinding::unknown();
  }

  if (const auto * name = dyn_cast<NameExpr>(call->callee)) {
    const auto it = function_returns_.find(name->name);
    if (it != function_returns_.end()) {
      return bound_to(it->second, Confidence::Certain);
    }
    if (name->name == "merge") {
      return union_of({operand(call, 0, "left"), operand(call, 1, "right")});
    }
    if (name->name == "concat") {
      return union_of(concat_operands(call));
    }
    return SchemaBinding::unknown();
  }

  const auto * attr = dyn_cast<AttributeExpr>(call->callee);
  if (attr == nullptr) {
    return SchemaBinding::unknown();
  }
  const std::string_view method = attr->attr;

  // PandasFrame.from_schema(df, S), PandasFrame.read_csv(path, S)
  if (method == "from_schema" || is_reader_method(method)) {
    if (const SchemaDefinition * s = schema_named(positional_arg(call, 1))) {
      return bound_to(s, Confidence::Certain);
    }
  }
  // S.from_pandas(df)
  if (method == "from_pandas" || method == "from_polars" || method == "validate") {
    if (const SchemaDefinition * s = schema_named(attr->base)) {
      return bound_to(s, Confidence::Certain);
    }
  }
  // S().read_csv(path)
  if (const auto * inner = dyn_cast<CallExpr>(attr->base)) {
    if (const SchemaDefinition * s = schema_named(inner->callee)) {
      return bound_to(s, Confidence::Certain);
    }
  }

  const SchemaBinding receiver = infer(attr->base);
  if (!receiver.is_unknown()) {
    return infer_method(call, attr, receiver);
  }

  // pd.merge(a, b), pd.concat([a, b]), pl.concat([...])
  if (method == "merge") {
    return union_of({operand(call, 0, "left"), operand(call, 1, "right")});
  }
  if (method == "concat") {
    return union_of(concat_operands(call));
  }
  return SchemaBinding::unknown();
}

SchemaBinding BindingResolver::infer_method(
  const CallExpr * call, const AttributeExpr * callee, const SchemaBinding & receiver)
{
  const std::string_view method = callee->attr;

  if (method == "drop") {
    if (drops_rows(call)) {
      return bound_to(receiver.schema, Confidence::Inferred);
    }
    std::vector<std::string> names;
    if (const Argument * columns = find_keyword(call, "columns")) {
      if (!column_names(columns->value, names)) {
        return SchemaBinding::unknown();
      }
    } else {
      for (const auto * arg : call->args) {
        if (arg->is_positional() && !column_names(arg->value, names)) {
          return SchemaBinding::unknown();
        }
      }
    }
    return drop_from(receiver, names);
  }

  if (is_preserving_method(method)) {
    return bound_to(receiver.schema, Confidence::Inferred);
  }

  if (method == "merge" || method == "join") {
    const Expr * other = operand(call, 0, "right");
    if (other == nullptr) {
      other = operand(call, 0, "other");
    }
    if (other == nullptr) {
      return SchemaBinding::unknown();
    }
    return union_of({callee->base, other});
  }

  if (method == "select") {
    std::vector<std::string> names;
    for (const auto * arg : call->args) {
      if (!arg->is_positional() || !column_names(arg->value, names)) {
        return SchemaBinding::unknown();
      }
    }
    return subset_of(receiver, names);
  }

  return SchemaBinding::unknown();
}

SchemaBinding BindingResolver::infer_subscript(const SubscriptExpr * sub)
{
  // df.loc[mask] / df.iloc[0:10]; a (rows, columns) pair may pick a single column.
  if (const auto * indexer = dyn_cast<AttributeExpr>(sub->base)) {
    if (indexer->attr == "loc" || indexer->attr == "iloc") {
      const SchemaBinding receiver = infer(indexer->base);
      if (receiver.is_unknown() || isa<TupleExpr>(sub->index)) {
        return SchemaBinding::unknown();
      }
      return bound_to(receiver.schema, Confidence::Inferred);
    }
  }

  const SchemaBinding frame = infer(sub->base);
  if (frame.is_unknown()) {
    return SchemaBinding::unknown();
  }

  const Expr * index = sub->index;
  if (isa<ListExpr>(index)) {
    std::vector<std::string> names;
    if (!column_names(index, names)) {
      return SchemaBinding::unknown();
    }
    return subset_of(frame, names);
  }
  if (isa<SliceExpr>(index) || is_boolean_mask(index)) {
    return bound_to(frame.schema, Confidence::Inferred);
  }
  // A single column, or something computed.
  return SchemaBinding::unknown();
}

SchemaBinding BindingResolver::union_of(const std::vector<const Expr *> & operands)
{
  std::vector<const SchemaDefinition *> parts;
  for (const auto * e : operands) {
    if (e == nullptr) {
      return SchemaBinding::unknown();
    }
    const SchemaBinding b = infer(e);
    if (b.is_unknown()) {
      return SchemaBinding::unknown();
    }
    if (std::find(parts.begin(), parts.end(), b.schema) == parts.end()) {
      parts.push_back(b.schema);
    }
  }
  if (parts.empty()) {
    return SchemaBinding::unknown();
  }
  if (parts.size() == 1) {
    return bound_to(parts.front(), Confidence::Inferred);
  }

  std::vector<std::string> names;
  names.reserve(parts.size());
  for (const auto * p : parts) {
    names.push_back(p->name);
  }

  auto merged = std::make_unique<SchemaDefinition>();
  merged->name = join(names, " + ");
  merged->declared_at = parts.front()->declared_at;
  merged->origin = DeclarationStyle::Synthesized;
  if (compose_into(*merged, parts)) {
    return SchemaBinding::unknown();
  }
  merged->allow_extra_columns = true;
  return bound_to(env_.adopt(std::move(merged)), Confidence::Inferred);
}

SchemaBinding BindingResolver::subset_of(
  const SchemaBinding & source, const std::vector<std::string> & names)
{
  if (source.is_unknown()) {
    return SchemaBinding::unknown();
  }
  const SchemaDefinition & from = *source.schema;
  auto subset = make_subset(
    from, names, from.name + ".select(" + join(names, ", ") + ")", DeclarationStyle::Synthesized);
  subset->declared_at = from.declared_at;
  return bound_to(env_.adopt(std::move(subset)), Confidence::Inferred);
}

SchemaBinding BindingResolver::drop_from(
  const SchemaBinding & source, const std::vector<std::string> & names)
{
  if (source.is_unknown()) {
    return SchemaBinding::unknown();
  }
  if (names.empty()) {
    return bound_to(source.schema, Confidence::Inferred);
  }
  const SchemaDefinition & from = *source.schema;
  auto rest = make_drop(
    from, names, from.name + ".drop(" + join(names, ", ") + ")", DeclarationStyle::Synthesized);
  rest->declared_at = from.declared_at;
  return bound_to(env_.adopt(std::move(rest)), Confidence::Inferred);
}

// ============================================================================
// Access sites
// ============================================================================

std::optional<std::string> BindingResolver::report_column_ref(
  const Expr * frame_expr, const SchemaBinding & frame, const Expr * ref, AccessMode mode)
{
  AccessSite site;
  site.variable = describe_frame_expr(frame_expr);
  site.mode = mode;

  if (auto literal = string_literal_value(ref)) {
    site.kind = AccessKind::LiteralSubscript;
    site.name = std::string(*literal);
    site.range = ref->get_range();
    sink_.on_access(site, frame);
    return site.name;
  }

  const auto * attr = dyn_cast<AttributeExpr>(ref);
  if (attr == nullptr) {
    return std::nullopt;
  }
  const SchemaDefinition * other = schema_named(attr->base);
  if (other == nullptr || !other->resolved) {
    return std::nullopt;
  }
  site.kind = AccessKind::SchemaColumnSubscript;
  site.name = std::string(attr->attr);
  site.range = attr->attr_range;
  site.referenced_schema = other;
  sink_.on_access(site, frame);

  const ColumnDefinition * col = other->find_by_name(attr->attr);
  if (col == nullptr) {
    return std::nullopt;
  }
  return col->is_exact() ? col->lookup_key : col->name;
}

std::vector<std::string> BindingResolver::report_index(
  const Expr * frame_expr, const SchemaBinding & frame, const Expr * index, AccessMode mode)
{
  std::vector<std::string> names;
  if (const auto * list = dyn_cast<ListExpr>(index)) {
    for (const auto * e : list->elements) {
      if (auto n = report_column_ref(frame_expr, frame, e, mode)) {
        names.push_back(std::move(*n));
      }
    }
    return names;
  }
  if (auto n = report_column_ref(frame_expr, frame, index, mode)) {
    names.push_back(std::move(*n));
  }
  return names;
}

void BindingResolver::report_selection_args(
  const CallExpr * call, const AttributeExpr * callee, const SchemaBinding & receiver)
{
  const Expr * frame_expr = callee->base;
  if (callee->attr == "select") {
    for (const auto * arg : call->args) {
      if (arg->is_positional()) {
        (void)report_index(frame_expr, receiver, arg->value, AccessMode::Read);
      }
    }
    return;
  }
  if (callee->attr == "drop" && !drops_rows(call)) {
    if (const Argument * columns = find_keyword(call, "columns")) {
      (void)report_index(frame_expr, receiver, columns->value, AccessMode::Read);
      return;
    }
    for (const auto * arg : call->args) {
      if (arg->is_positional()) {
        (void)report_index(frame_expr, receiver, arg->value, AccessMode::Read);
      }
    }
  }
}

// ============================================================================
// Binding updates
// ============================================================================

void BindingResolver::assign_to(const Expr * target, const SchemaBinding & value)
{
  if (const auto * name = dyn_cast<NameExpr>(target)) {
    scope_->bind(name->name, value.schema, value.confidence);
    return;
  }
  if (const auto * sub = dyn_cast<SubscriptExpr>(target)) {
    write_subscript(sub);
    return;
  }
  if (const auto * attr = dyn_cast<AttributeExpr>(target)) {
    visit(attr->base);
    return;
  }
  if (const auto * star = dyn_cast<StarredExpr>(target)) {
    assign_to(star->value, SchemaBinding::unknown());
    return;
  }

  gsl::span<Expr * const> elements;
  if (const auto * list = dyn_cast<ListExpr>(target)) {
    elements = list->elements;
  } else if (const auto * tuple = dyn_cast<TupleExpr>(target)) {
    elements = tuple->elements;
  }
  for (const auto * e : elements) {
    assign_to(e, SchemaBinding::unknown());
  }
}

void BindingResolver::write_subscript(const SubscriptExpr * target)
{
  SchemaBinding frame = infer(target->base);
  visit(target->base);
  if (frame.is_unknown()) {
    visit(target->index);
    return;
  }

  const std::vector<std::string> written =
    report_index(target->base, frame, target->index, AccessMode::Write);
  visit(target->index);

  // From here on the frame also carries the written columns.
  const auto * name = dyn_cast<NameExpr>(target->base);
  if (name == nullptr) {
    return;
  }
  std::vector<std::string> added;
  for (const auto & column : written) {
    if (!frame.schema->accepts_literal(column) &&
        std::find(added.begin(), added.end(), column) == added.end()) {
      added.push_back(column);
    }
  }
  if (added.empty()) {
    return;
  }

  auto extended = std::make_unique<SchemaDefinition>(*frame.schema);
  for (const auto & column : added) {
    ColumnDefinition def;
    def.name = column;
    def.lookup_key = column;
    def.value_type = ValueType::any();
    def.declared_at = target->index->get_range();
    extended->columns.push_back(std::move(def));
  }
  scope_->bind(name->name, env_.adopt(std::move(extended)), Confidence::Inferred);
}

void BindingResolver::forget_targets(const Expr * target)
{
  if (const auto * name = dyn_cast<NameExpr>(target)) {
    scope_->forget(name->name);
    return;
  }
  if (const auto * star = dyn_cast<StarredExpr>(target)) {
    forget_targets(star->value);
    return;
  }
  gsl::span<Expr * const> elements;
  if (const auto * list = dyn_cast<ListExpr>(target)) {
    elements = list->elements;
  } else if (const auto * tuple = dyn_cast<TupleExpr>(target)) {
    elements = tuple->elements;
  } else {
    visit(target);
    return;
  }
  for (const auto * e : elements) {
    forget_targets(e);
  }
}

// ============================================================================
// Statements
// ============================================================================

bool BindingResolver::visit_assign_stmt(const AssignStmt * node)
{
  visit(node->value);
  const SchemaBinding value = infer(node->value);
  for (const auto * target : node->targets) {
    assign_to(target, value);
  }
  return true;
}

bool BindingResolver::visit_aug_assign_stmt(const AugAssignStmt * node)
{
  visit(node->value);
  // `df["x"] += 1` reads the column before writing it back.
  if (const auto * name = dyn_cast<NameExpr>(node->target)) {
    scope_->forget(name->name);
  } else {
    visit(node->target);
  }
  return true;
}

bool BindingResolver::visit_ann_assign_stmt(const AnnAssignStmt * node)
{
  visit_opt(node->value);

  const auto * name = dyn_cast<NameExpr>(node->target);
  if (name == nullptr) {
    if (node->value != nullptr) {
      assign_to(node->target, infer(node->value));
    }
    return true;
  }

  SchemaBinding b;
  if (const SchemaDefinition * schema = annotation_schema(node->annotation)) {
    b = bound_to(schema, Confidence::Certain);
  } else if (node->value != nullptr) {
    b = infer(node->value);
  }
  scope_->bind(name->name, b.schema, b.confidence);
  return true;
}

bool BindingResolver::visit_delete_stmt(const DeleteStmt * node)
{
  for (const auto * target : node->targets) {
    if (const auto * name = dyn_cast<NameExpr>(target)) {
      scope_->forget(name->name);
    } else {
      visit(target);
    }
  }
  return true;
}

bool BindingResolver::visit_import_stmt(const ImportStmt * node)
{
  for (const auto * alias : node->names) {
    std::string_view bound = alias->bound_name();
    if (alias->asname.empty()) {
      // `import a.b` binds `a`
      bound = bound.substr(0, bound.find('.'));
    }
    scope_->forget(bound);
  }
  return true;
}

bool BindingResolver::visit_import_from_stmt(const ImportFromStmt * node)
{
  for (const auto * alias : node->names) {
    if (alias->name != "*") {
      scope_->forget(alias->bound_name());
    }
  }
  return true;
}

bool BindingResolver::visit_if_stmt(const IfStmt * node)
{
  visit(node->condition);

  const BindingScope::Table before = scope_->snapshot();
  visit_body(node->then_body);
  const BindingScope::Table after_then = scope_->snapshot();

  scope_->restore(before);
  visit_body(node->else_body);
  const BindingScope::Table after_else = scope_->snapshot();

  scope_->merge(after_then, after_else);
  return true;
}

bool BindingResolver::visit_while_stmt(const WhileStmt * node)
{
  visit(node->condition);

  const BindingScope::Table before = scope_->snapshot();
  visit_body(node->body);
  const BindingScope::Table after = scope_->snapshot();
  scope_->merge(before, after);

  visit_body(node->else_body);
  return true;
}

bool BindingResolver::visit_for_stmt(const ForStmt * node)
{
  visit(node->iter);

  const BindingScope::Table before = scope_->snapshot();
  forget_targets(node->target);
  visit_body(node->body);
  const BindingScope::Table after = scope_->snapshot();
  scope_->merge(before, after);

  visit_body(node->else_body);
  return true;
}

bool BindingResolver::visit_with_stmt(const WithStmt * node)
{
  for (const auto * item : node->items) {
    visit(item->context);
    if (item->target != nullptr) {
      forget_targets(item->target);
    }
  }
  visit_body(node->body);
  return true;
}

bool BindingResolver::visit_try_stmt(const TryStmt * node)
{
  const BindingScope::Table before = scope_->snapshot();
  visit_body(node->body);
  const BindingScope::Table after_body = scope_->snapshot();

  // A handler may start anywhere inside the body.
  scope_->merge(before, after_body);
  const BindingScope::Table handler_entry = scope_->snapshot();

  std::vector<BindingScope::Table> outcomes;
  scope_->restore(after_body);
  visit_body(node->else_body);
  outcomes.push_back(scope_->snapshot());

  for (const auto * handler : node->handlers) {
    scope_->restore(handler_entry);
    visit_opt(handler->type);
    if (!handler->name.empty()) {
      scope_->forget(handler->name);
    }
    visit_body(handler->body);
    outcomes.push_back(scope_->snapshot());
  }

  merge_outcomes(outcomes);
  visit_body(node->finally_body);
  return true;
}

bool BindingResolver::visit_match_stmt(const MatchStmt * node)
{
  visit(node->subject);

  const BindingScope::Table before = scope_->snapshot();
  std::vector<BindingScope::Table> outcomes;
  bool exhaustive = false;
  for (const auto * clause : node->cases) {
    scope_->restore(before);
    std::vector<std::string_view> captures;
    pattern_captures(clause->pattern, captures);
    for (const auto name : captures) {
      scope_->forget(name);
    }
    visit_opt(clause->guard);
    visit_body(clause->body);
    outcomes.push_back(scope_->snapshot());

    // Later cases are unreachable.
    if (clause->guard == nullptr && is_irrefutable(clause->pattern)) {
      exhaustive = true;
      break;
    }
  }
  if (!exhaustive) {
    outcomes.push_back(before);
  }

  merge_outcomes(outcomes);
  return true;
}

bool BindingResolver::visit_type_alias_stmt(const TypeAliasStmt * node)
{
  // The value is evaluated lazily and never holds a frame.
  scope_->forget(node->name->name);
  return true;
}

bool BindingResolver::visit_function_def_stmt(const FunctionDefStmt * node)
{
  visit_all(node->decorators);
  for (const auto * param : node->params) {
    visit_opt(param->default_value);
  }
  scope_->forget(node->name);
  pending_.push_back(PendingBody{node, function_parent_, qualify(node->name)});
  return true;
}

bool BindingResolver::visit_class_def_stmt(const ClassDefStmt * node)
{
  visit_all(node->decorators);
  visit_all(node->bases);

  BindingScope * const outer = scope_;
  BindingScope & body_scope = env_.create_scope(qualify(node->name), outer);
  scope_ = &body_scope;
  visit_body(node->body);
  scope_ = outer;

  scope_->forget(node->name);
  return true;
}

// ============================================================================
// Expressions
// ============================================================================

bool BindingResolver::visit_subscript_expr(const SubscriptExpr * node)
{
  const SchemaBinding frame = infer(node->base);
  if (!frame.is_unknown()) {
    (void)report_index(node->base, frame, node->index, AccessMode::Read);
  }
  visit(node->base);
  visit(node->index);
  return true;
}

bool BindingResolver::visit_attribute_expr(const AttributeExpr * node)
{
  const std::string_view attr = node->attr;
  if (!attr.empty() && attr.front() != '_' && !is_frame_api_member(attr)) {
    const SchemaBinding frame = infer(node->base);
    if (!frame.is_unknown()) {
      AccessSite site;
      site.variable = describe_frame_expr(node->base);
      site.kind = AccessKind::Attribute;
      site.mode = AccessMode::Read;
      site.name = std::string(attr);
      site.range = node->attr_range;
      sink_.on_access(site, frame);
    }
  }
  visit(node->base);
  return true;
}

bool BindingResolver::visit_call_expr(const CallExpr * node)
{
  // A called attribute is a method, never a column.
  if (const auto * callee = dyn_cast<AttributeExpr>(node->callee)) {
    const SchemaBinding receiver = infer(callee->base);
    if (!receiver.is_unknown()) {
      report_selection_args(node, callee, receiver);
    }
    visit(callee->base);
  } else {
    visit(node->callee);
  }
  visit_all(node->args);
  return true;
}

bool BindingResolver::visit_named_expr(const NamedExpr * node)
{
  visit(node->value);
  const SchemaBinding value = infer(node->value);
  scope_->bind(node->target->name, value.schema, value.confidence);
  return true;
}

bool BindingResolver::visit_lambda_expr(const LambdaExpr * node)
{
  for (const auto * param : node->params) {
    visit_opt(param->default_value);
  }

  BindingScope * const outer = scope_;
  BindingScope & lambda_scope = env_.create_scope(outer->qualifier(), outer);
  for (const auto * param : node->params) {
    if (!param->name.empty()) {
      lambda_scope.forget(param->name);
    }
  }
  scope_ = &lambda_scope;
  visit(node->body);
  scope_ = outer;
  return true;
}

bool BindingResolver::visit_comprehension_expr(const ComprehensionExpr * node)
{
  BindingScope * const outer = scope_;
  BindingScope & comp_scope = env_.create_scope(outer->qualifier(), outer);
  scope_ = &comp_scope;
  for (const auto * clause : node->clauses) {
    visit(clause->iter);
    forget_targets(clause->target);
    visit_all(clause->conditions);
  }
  visit_opt(node->element);
  visit_opt(node->value);
  scope_ = outer;
  return true;
}

}  // namespace schemaflow
