#include "emitter.h"
#include "codegen_utils.h"

namespace
{

bool is_view_node(const IRNode* node)
{
    return node->kind == IRKind::ELEMENT || node->kind == IRKind::COMPONENT_CALL || node->kind == IRKind::FRAGMENT;
}

bool is_spread_child(const IRNode& child)
{
    auto* wrapper = ir_cast<JSXChildIR>(&child);
    return wrapper && wrapper->expression->kind == IRKind::SPREAD;
}

} // namespace

// { key: value, ...spread } in source order. Bare attributes are true.
std::string Emitter::attributes_text(const std::vector<AttributeIR>& attributes, bool dom_names)
{
    if (attributes.empty())
        return "{}";

    std::string text = "{ ";
    for (size_t i = 0; i < attributes.size(); i++)
    {
        const AttributeIR& attr = attributes[i];
        if (i > 0)
            text += ", ";
        if (attr.is_spread)
        {
            text += "..." + expr(attr.value.get());
            continue;
        }
        text += property_key(dom_names ? dom_property_name(attr.name) : attr.name) + ": ";
        text += attr.value ? expr(attr.value.get()) : std::string("true");
    }
    return text + " }";
}

std::string Emitter::static_child_text(const IRNode& child)
{
    return expr(&child);
}

std::string Emitter::static_element_text(const ElementIR& element)
{
    std::string text = "t_element(" + quote_string(element.tag) + ", " + attributes_text(element.attributes, true) + ", [";
    for (size_t i = 0; i < element.children.size(); i++)
    {
        if (i > 0)
            text += ", ";
        text += static_child_text(*element.children[i]);
    }
    return text + "])";
}

std::string Emitter::element_text(const ElementIR& element)
{
    use_runtime("t_element");
    if (element.is_static)
        return static_element_text(element);

    std::string el = temp("el");
    std::string out = "(() => {\n";
    level++;
    out += pad() + "const " + el + " = t_element(" + quote_string(element.tag) + ", " +
           attributes_text(element.attributes, true) + ", []);\n";

    for (const auto& binding : element.signal_bindings)
    {
        if (binding.is_attribute)
        {
            set_attribute_effect(el, binding, out);
            continue;
        }
        use_runtime("$REGISTRY");
        out += pad() + "$REGISTRY.wire(" + el + ", " + quote_string(binding.property) + ", () => " +
               arrow_body(*binding.expression) + ");\n";
    }
    for (const auto& handler : element.event_handlers)
    {
        out += pad() + el + ".addEventListener(" + quote_string(handler.event_name) + ", " +
               expr(handler.handler.get()) + ");\n";
    }
    for (const auto& child : element.children)
    {
        append_child(el, *child, out);
    }

    out += pad() + "return " + el + ";\n";
    level--;
    return out + pad() + "})()";
}

// null and false remove the attribute
void Emitter::set_attribute_effect(const std::string& el, const SignalBindingIR& binding, std::string& out)
{
    use_runtime("createEffect");
    std::string v = temp("a");
    std::string name = quote_string(binding.property);
    out += pad() + "createEffect(() => {\n";
    level++;
    out += pad() + "const " + v + " = " + expr(binding.expression.get()) + ";\n";
    out += pad() + "if (" + v + " == null || " + v + " === false) " + el + ".removeAttribute(" + name + ");\n";
    out += pad() + "else " + el + ".setAttribute(" + name + ", String(" + v + "));\n";
    level--;
    out += pad() + "});\n";
}

void Emitter::append_guarded(const std::string& parent, const std::string& value, std::string& out)
{
    std::string v = temp("v");
    out += pad() + "const " + v + " = " + value + ";\n";
    out += pad() + "if (" + v + " != null && " + v + " !== false) " + parent + ".append(" + v + ");\n";
}

void Emitter::append_child(const std::string& parent, const IRNode& child, std::string& out)
{
    if (child.kind == IRKind::JSX_TEXT)
    {
        out += pad() + parent + ".appendChild(document.createTextNode(" +
               quote_string(static_cast<const JSXTextIR&>(child).value) + "));\n";
        return;
    }
    if (child.kind != IRKind::JSX_CHILD)
    {
        out += pad() + parent + ".appendChild(" + expr(&child) + ");\n";
        return;
    }

    const auto& wrapper = static_cast<const JSXChildIR&>(child);
    const ClassificationResult& info = wrapper.classification;
    const IRNode* value = wrapper.expression.get();

    if (is_view_node(value))
    {
        out += pad() + parent + ".appendChild(" + expr(value) + ");\n";
        return;
    }

    bool spread = value->kind == IRKind::SPREAD;
    if (spread)
        value = static_cast<const SpreadIR*>(value)->argument.get();
    bool list = spread || info.category == ReactivityCategory::LOOP || info.strategy == EmitStrategy::LIST_RECONCILE;
    // a .map() over a plain value is rendered once
    bool reactive = !info.is_static() && (!info.dependencies.empty() || info.category != ReactivityCategory::LOOP);

    if (reactive && info.is_text && !list)
    {
        use_runtime("$REGISTRY");
        std::string text_node = temp("t");
        std::string getter;
        if (info.is_nullable)
        {
            std::string v = temp("v");
            getter = "{ const " + v + " = " + expr(value) + "; return " + v + " == null || " + v + " === false ? '' : String(" + v + "); }";
        }
        else
        {
            getter = arrow_body(*value);
        }
        out += pad() + "const " + text_node + " = document.createTextNode('');\n";
        out += pad() + "$REGISTRY.wire(" + text_node + ", 'textContent', () => " + getter + ");\n";
        out += pad() + parent + ".appendChild(" + text_node + ");\n";
        return;
    }

    if (reactive)
    {
        append_reactive(parent, *value, out);
        return;
    }

    // Arrays and .map() results are flattened into the parent
    if (list)
    {
        std::string v = temp("v");
        std::string n = temp("n");
        out += pad() + "const " + v + " = " + expr(value) + ";\n";
        out += pad() + "for (const " + n + " of Array.isArray(" + v + ") ? " + v + ".flat(Infinity) : [" + v + "]) {\n";
        level++;
        out += pad() + "if (" + n + " != null && " + n + " !== false) " + parent + ".append(" + n + ");\n";
        level--;
        out += pad() + "}\n";
        return;
    }

    if (info.strategy == EmitStrategy::GUARDED_APPEND || info.is_nullable)
    {
        append_guarded(parent, expr(value), out);
        return;
    }

    out += pad() + parent + ".append(" + expr(value) + ");\n";
}

// Re-rendered region for values that may be nodes, arrays or text.
// The nodes sit before a comment anchor and are replaced on every run:
//
//   const _anchor1 = document.createComment('');
//   parent.appendChild(_anchor1);
//   let _nodes2: Node[] = [];
//   createEffect(() => { ... });
void Emitter::append_reactive(const std::string& parent, const IRNode& value, std::string& out)
{
    use_runtime("createEffect");
    std::string anchor = temp("anchor");
    std::string nodes = temp("nodes");
    std::string v = temp("v");
    std::string n = temp("n");
    std::string node = temp("node");

    out += pad() + "const " + anchor + " = document.createComment('');\n";
    out += pad() + parent + ".appendChild(" + anchor + ");\n";
    out += pad() + "let " + nodes + ": Node[] = [];\n";
    out += pad() + "createEffect(() => {\n";
    level++;
    out += pad() + "const " + v + " = " + expr(&value) + ";\n";
    out += pad() + "for (const " + n + " of " + nodes + ") " + n + ".parentNode?.removeChild(" + n + ");\n";
    out += pad() + nodes + " = [];\n";
    out += pad() + "for (const " + n + " of Array.isArray(" + v + ") ? " + v + ".flat(Infinity) : [" + v + "]) {\n";
    level++;
    out += pad() + "if (" + n + " == null || " + n + " === false) continue;\n";
    out += pad() + "const " + node + " = " + n + " instanceof Node ? " + n + " : document.createTextNode(String(" + n + "));\n";
    out += pad() + anchor + ".parentNode!.insertBefore(" + node + ", " + anchor + ");\n";
    out += pad() + nodes + ".push(" + node + ");\n";
    level--;
    out += pad() + "}\n";
    level--;
    out += pad() + "});\n";
}

// Name({ ...props, children })
std::string Emitter::component_call_text(const ComponentCallIR& call)
{
    std::string props = attributes_text(call.props, false);
    if (call.children.empty())
        return call.name + "(" + props + ")";

    std::string children;
    if (call.children.size() == 1 && !is_spread_child(*call.children[0]))
    {
        children = expr(call.children[0].get());
    }
    else
    {
        children = "[";
        for (size_t i = 0; i < call.children.size(); i++)
        {
            if (i > 0)
                children += ", ";
            children += expr(call.children[i].get());
        }
        children += "]";
    }

    if (props == "{}")
        return call.name + "({ children: " + children + " })";
    // props ends in " }"
    return call.name + "(" + props.substr(0, props.size() - 2) + ", children: " + children + " })";
}

std::string Emitter::fragment_text(const FragmentIR& fragment)
{
    std::string frag = temp("frag");
    std::string out = "(() => {\n";
    level++;
    out += pad() + "const " + frag + " = document.createDocumentFragment();\n";
    for (const auto& child : fragment.children)
    {
        append_child(frag, *child, out);
    }
    out += pad() + "return " + frag + ";\n";
    level--;
    return out + pad() + "})()";
}
