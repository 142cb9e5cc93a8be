#include <stencil/tmpl/Renderer.hpp>

#include <stencil/builtins/ValueUtil.hpp>
#include <stencil/eval/Evaluator.hpp>
#include <stencil/parse/Parser.hpp>
#include <stencil/text/Utf8.hpp>

namespace stencil::tmpl {

namespace {

using eval::Value;
using builtins::util::make_bool;
using builtins::util::make_int;
using builtins::util::make_string;

Value loop_info(size_t i, size_t n) {
    Value::Object o;
    const auto idx = static_cast<int64_t>(i);
    const auto len = static_cast<int64_t>(n);
    o["index"] = make_int(idx + 1);
    o["index0"] = make_int(idx);
    o["first"] = make_bool(i == 0);
    o["last"] = make_bool(i + 1 == n);
    o["length"] = make_int(len);
    o["revindex"] = make_int(len - idx);
    o["revindex0"] = make_int(len - idx - 1);
    return builtins::util::make_object(std::move(o));
}

std::string tag_text(const TemplateNode& n) {
    switch (n.kind) {
        case NodeKind::kExpression: return "{{ " + n.content + " }}";
        case NodeKind::kControlTag: return "{% " + n.content + " %}";
        default: return n.content;
    }
}

} // namespace

std::string Renderer::location_note(const TemplateNode& node, size_t index) const {
    return "in " + tag_text(node) + " at template offset " + std::to_string(node.offset) +
           " (node " + std::to_string(index) + ")";
}

void Renderer::malformed(const TemplateNode& node, std::string msg) {
    diags_.add(diag::Code::T_MALFORMED_CONTROL_TAG, where_, node.offset, std::move(msg));
}

void Renderer::unclosed(const TemplateNode& node, size_t index) {
    diags_.add(diag::Code::T_UNCLOSED_BLOCK, where_, node.offset,
               std::string("unclosed '") + control_tag_kind_name(node.control.kind) +
                   "' block opened at node " + std::to_string(index));
}

std::optional<std::string> Renderer::render(const Nodes& nodes, const eval::Context& ctx) {
    iterations_ = 0;
    std::string out;
    if (!render_range(nodes, 0, nodes.size(), ctx, 0, out)) return std::nullopt;
    return out;
}

bool Renderer::render_range(const Nodes& nodes, size_t begin, size_t end,
                            const eval::Context& ctx, uint32_t depth, std::string& out) {
    if (depth > env_.budget.max_block_depth) {
        const uint32_t off = begin < nodes.size() ? nodes[begin].offset : 0;
        diags_.add(diag::Code::E_BUDGET_EXCEEDED, where_, off, "block nesting exceeds render budget");
        return false;
    }

    size_t i = begin;
    while (i < end) {
        const TemplateNode& node = nodes[i];
        const size_t mark = diags_.size();

        switch (node.kind) {
            case NodeKind::kText:
                out += node.content;
                ++i;
                continue;
            case NodeKind::kComment:
                ++i;
                continue;
            case NodeKind::kExpression:
                if (!render_expression(node, ctx, out)) {
                    diags_.attach_note(mark, location_note(node, i));
                    return false;
                }
                ++i;
                continue;
            case NodeKind::kControlTag:
                break;
        }

        std::optional<size_t> next;
        switch (node.control.kind) {
            case ControlTagKind::kIf:
                next = render_if(nodes, i, end, ctx, depth, out);
                break;
            case ControlTagKind::kFor:
                next = render_for(nodes, i, end, ctx, depth, out);
                break;
            case ControlTagKind::kUnknown:
                malformed(node, node.control.error);
                break;
            default:
                malformed(node, std::string("unexpected '") + control_tag_kind_name(node.control.kind) +
                                    "' without a matching opener");
                break;
        }

        if (!next) {
            diags_.attach_note(mark, location_note(node, i));
            return false;
        }
        i = *next;
    }
    return true;
}

bool Renderer::render_expression(const TemplateNode& node, const eval::Context& ctx, std::string& out) {
    if (node.content.empty()) return true;

    auto expr = parse::parse_source(node.content, where_, diags_);
    if (!expr) return false;

    eval::Evaluator ev(env_, diags_, where_);
    auto r = ev.evaluate_output(*expr, ctx);
    if (!r) return false;
    if (r->state == eval::Definedness::kUndefined) return true;

    out += eval::to_display(r->value);
    return true;
}

std::optional<Value> Renderer::eval_condition(const TemplateNode& node, const eval::Context& ctx) {
    auto expr = parse::parse_source(node.control.expression, where_, diags_);
    if (!expr) return std::nullopt;

    eval::Evaluator ev(env_, diags_, where_);
    return ev.evaluate(*expr, ctx);
}

std::optional<size_t> Renderer::render_if(const Nodes& nodes, size_t open, size_t limit,
                                          const eval::Context& ctx, uint32_t depth, std::string& out) {
    static const std::vector<ControlTagKind> kBranchStoppers{ControlTagKind::kElseIf, ControlTagKind::kElse};

    bool taken = false;
    size_t branch = open;
    while (true) {
        const TemplateNode& head = nodes[branch];
        const ControlTagKind kind = head.control.kind;

        auto span = find_block(nodes, branch, limit, ControlTagKind::kEndIf, kBranchStoppers);
        if (!span) {
            unclosed(nodes[open], open);
            return std::nullopt;
        }

        if (!taken) {
            bool run = kind == ControlTagKind::kElse;
            if (!run) {
                const size_t mark = diags_.size();
                auto cond = eval_condition(head, ctx);
                if (!cond) {
                    if (branch != open) diags_.attach_note(mark, location_note(head, branch));
                    return std::nullopt;
                }
                run = eval::truthy(*cond);
            }
            if (run) {
                taken = true;
                const size_t mark = diags_.size();
                if (!render_range(nodes, branch + 1, span->end, ctx, depth + 1, out)) {
                    if (branch != open) diags_.attach_note(mark, location_note(head, branch));
                    return std::nullopt;
                }
            }
        }

        const TemplateNode& stop = nodes[span->end];
        switch (span->ended_by) {
            case ControlTagKind::kEndIf:
                return span->end + 1;
            case ControlTagKind::kElseIf:
            case ControlTagKind::kElse:
                if (kind == ControlTagKind::kElse) {
                    malformed(stop, std::string("'") + control_tag_kind_name(span->ended_by) +
                                        "' after 'else' in the same if block");
                    return std::nullopt;
                }
                break;
            default:
                malformed(stop, "malformed tag where elif/else/endif was expected: " + stop.control.error);
                return std::nullopt;
        }
        branch = span->end;
    }
}

bool Renderer::collect_items(const Value& coll, size_t arity, const TemplateNode& node,
                             std::vector<std::vector<Value>>& items) {
    if (coll.is_null()) return true;

    if (auto arr = coll.as_array()) {
        for (const auto& v : *arr) {
            if (arity == 1) {
                items.push_back({v});
                continue;
            }
            auto pair = v.as_array();
            if (!pair || pair->size() != 2) {
                diags_.add(diag::Code::E_TYPE_ERROR, where_, node.offset,
                           "cannot unpack " + eval::type_name(v) + " into 2 loop variables");
                return false;
            }
            items.push_back({(*pair)[0], (*pair)[1]});
        }
        return true;
    }

    if (auto obj = coll.as_object()) {
        for (const auto& [k, v] : *obj) {
            if (arity == 1) items.push_back({v});
            else items.push_back({make_string(k), v});
        }
        return true;
    }

    if (auto s = coll.as_string()) {
        if (arity != 1) {
            diags_.add(diag::Code::E_TYPE_ERROR, where_, node.offset, "cannot unpack string characters");
            return false;
        }
        for (auto& ch : text::split_chars(*s)) items.push_back({make_string(std::move(ch))});
        return true;
    }

    if (auto native = coll.as_native_object(); native && native->keys && native->get_attribute) {
        const eval::CallSite site{where_, node.offset};
        for (const auto& k : native->keys()) {
            const size_t before = diags_.size();
            auto v = native->get_attribute(k, site, diags_);
            if (!v) {
                if (diags_.size() == before) {
                    diags_.add(diag::Code::E_ATTRIBUTE_NOT_FOUND, where_, node.offset,
                               "object '" + native->name + "' has no attribute '" + k + "'");
                }
                return false;
            }
            if (arity == 1) items.push_back({std::move(*v)});
            else items.push_back({make_string(k), std::move(*v)});
        }
        return true;
    }

    diags_.add(diag::Code::E_NOT_ITERABLE, where_, node.offset,
               "cannot iterate over " + eval::type_name(coll));
    return false;
}

std::optional<size_t> Renderer::render_for(const Nodes& nodes, size_t open, size_t limit,
                                           const eval::Context& ctx, uint32_t depth, std::string& out) {
    const TemplateNode& head = nodes[open];

    auto span = find_block(nodes, open, limit, ControlTagKind::kEndFor);
    if (!span) {
        unclosed(head, open);
        return std::nullopt;
    }
    if (span->ended_by != ControlTagKind::kEndFor) {
        const TemplateNode& stop = nodes[span->end];
        malformed(stop, "malformed tag inside for block: " + stop.control.error);
        return std::nullopt;
    }

    std::string why;
    auto for_head = parse_for_head(head.control.expression, &why);
    if (!for_head) {
        malformed(head, why);
        return std::nullopt;
    }

    auto expr = parse::parse_source(for_head->collection, where_, diags_);
    if (!expr) return std::nullopt;
    eval::Evaluator ev(env_, diags_, where_);
    auto coll = ev.evaluate(*expr, ctx);
    if (!coll) return std::nullopt;

    std::vector<std::vector<Value>> items;
    if (!collect_items(*coll, for_head->vars.size(), head, items)) return std::nullopt;

    iterations_ += items.size();
    if (iterations_ > env_.budget.max_loop_iterations) {
        diags_.add(diag::Code::E_BUDGET_EXCEEDED, where_, head.offset,
                   "loop iterations exceed render budget (" +
                       std::to_string(env_.budget.max_loop_iterations) + ")");
        return std::nullopt;
    }

    for (size_t i = 0; i < items.size(); ++i) {
        eval::Context iter = ctx;
        for (size_t v = 0; v < for_head->vars.size(); ++v) {
            iter[for_head->vars[v]] = items[i][v];
        }
        iter["loop"] = loop_info(i, items.size());

        if (!render_range(nodes, open + 1, span->end, iter, depth + 1, out)) return std::nullopt;
    }

    return span->end + 1;
}

std::optional<std::string> render_template(std::string_view tpl,
                                           const eval::Context& ctx,
                                           const eval::Environment& env,
                                           diag::Bag& diags,
                                           std::string where) {
    const auto nodes = segment_template(tpl);
    Renderer r(env, diags, std::move(where));
    return r.render(nodes, ctx);
}

} // namespace stencil::tmpl
