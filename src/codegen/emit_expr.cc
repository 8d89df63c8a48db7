#include "emitter.h"
#include "codegen_utils.h"
#include "cli/error.h"

namespace
{

bool is_word_operator(const std::string& op)
{
    return op == "typeof" || op == "void" || op == "delete";
}

} // namespace

std::string Emitter::expression_list(const IRList& list)
{
    std::string text;
    for (size_t i = 0; i < list.size(); i++)
    {
        if (i > 0)
            text += ", ";
        text += expr(list[i].get());
    }
    return text;
}

std::string Emitter::type_arguments(const std::vector<std::string>& args) const
{
    if (args.empty())
        return "";
    std::string text = "<";
    for (size_t i = 0; i < args.size(); i++)
    {
        if (i > 0)
            text += ", ";
        text += args[i];
    }
    return text + ">";
}

std::string Emitter::decorators_text(const IRList& decorators, const std::string& separator)
{
    std::string text;
    for (const auto& decorator : decorators)
    {
        text += "@" + expr(decorator.get()) + separator;
    }
    return text;
}

std::string Emitter::params_text(const std::vector<ParamIR>& params)
{
    std::string text;
    for (size_t i = 0; i < params.size(); i++)
    {
        const ParamIR& param = params[i];
        if (i > 0)
            text += ", ";
        text += decorators_text(param.decorators, " ");
        for (const auto& modifier : param.modifiers)
        {
            text += modifier + " ";
        }
        if (param.rest)
            text += "...";
        text += expr(param.pattern.get());
        if (param.optional)
            text += "?";
        if (!param.type.empty())
            text += ": " + param.type;
        if (param.default_value)
            text += " = " + expr(param.default_value.get());
    }
    return text;
}

// Object literals in arrow bodies need parentheses
std::string Emitter::arrow_body(const IRNode& body)
{
    if (body.kind == IRKind::BLOCK)
        return braced(body);
    std::string text = expr(&body);
    if (!text.empty() && text[0] == '{')
        return "(" + text + ")";
    return text;
}

std::string Emitter::function_text(const FunctionIR& fn)
{
    std::string text;
    if (fn.is_declare)
        text += "declare ";
    if (fn.is_async)
        text += "async ";

    if (fn.form == FunctionForm::ARROW)
    {
        text += fn.type_parameters + "(" + params_text(fn.params) + ")";
        if (!fn.return_type.empty())
            text += ": " + fn.return_type;
        text += " => ";
        if (fn.body)
            return text + braced(*fn.body);
        return text + arrow_body(*fn.body_expression);
    }

    text += fn.is_generator ? "function*" : "function";
    if (!fn.name.empty())
        text += " " + fn.name;
    else if (!fn.is_generator)
        text += " ";
    text += fn.type_parameters + "(" + params_text(fn.params) + ")";
    if (!fn.return_type.empty())
        text += ": " + fn.return_type;
    if (fn.body)
        text += " " + braced(*fn.body);
    return text;
}

std::string Emitter::key_text(const IRNode* key, bool computed)
{
    if (computed)
        return "[" + expr(key) + "]";
    if (auto* id = ir_cast<IdentifierIR>(key))
        return id->name;
    return expr(key);
}

std::string Emitter::object_text(const ObjectIR& object)
{
    if (object.properties.empty())
        return "{}";

    std::string text = "{ ";
    for (size_t i = 0; i < object.properties.size(); i++)
    {
        const PropertyIR& prop = object.properties[i];
        if (i > 0)
            text += ", ";

        switch (prop.kind)
        {
        case PropertyKind::SPREAD:
            text += "..." + expr(prop.value.get());
            break;
        case PropertyKind::SHORTHAND:
        {
            std::string key = key_text(prop.key.get(), prop.computed);
            auto* id = ir_cast<IdentifierIR>(prop.value.get());
            auto* pattern = ir_cast<AssignmentPatternIR>(prop.value.get());
            auto* target = pattern ? ir_cast<IdentifierIR>(pattern->target.get()) : nullptr;
            if (!prop.value || (id && id->name == key))
                text += key;
            else if (target && target->name == key)
                text += key + " = " + expr(pattern->default_value.get());
            else
                text += key + ": " + expr(prop.value.get());
            break;
        }
        case PropertyKind::METHOD:
        case PropertyKind::GETTER:
        case PropertyKind::SETTER:
        {
            auto* fn = ir_cast<FunctionIR>(prop.value.get());
            if (prop.kind == PropertyKind::GETTER)
                text += "get ";
            else if (prop.kind == PropertyKind::SETTER)
                text += "set ";
            if (fn && fn->is_async)
                text += "async ";
            if (fn && fn->is_generator)
                text += "*";
            text += key_text(prop.key.get(), prop.computed);
            if (fn)
            {
                text += fn->type_parameters + "(" + params_text(fn->params) + ")";
                if (!fn->return_type.empty())
                    text += ": " + fn->return_type;
                text += fn->body ? " " + braced(*fn->body) : std::string(" {}");
            }
            break;
        }
        case PropertyKind::INIT:
            text += key_text(prop.key.get(), prop.computed) + ": " + expr(prop.value.get());
            break;
        }
    }
    return text + " }";
}

std::string Emitter::class_member_text(const ClassMemberIR& member)
{
    std::string text = decorators_text(member.decorators, " ");
    for (const auto& modifier : member.modifiers)
    {
        text += modifier + " ";
    }

    switch (member.kind)
    {
    case MemberKind::STATIC_BLOCK:
        return text + "static " + braced(*member.block);
    case MemberKind::INDEX_SIGNATURE:
        return text + member.type + ";";
    case MemberKind::PROPERTY:
        text += key_text(member.key.get(), member.computed);
        if (member.optional)
            text += "?";
        if (member.definite)
            text += "!";
        if (!member.type.empty())
            text += ": " + member.type;
        if (member.value)
            text += " = " + expr(member.value.get());
        return text + ";";
    case MemberKind::CONSTRUCTOR:
    case MemberKind::METHOD:
    case MemberKind::GETTER:
    case MemberKind::SETTER:
        break;
    }

    auto* fn = ir_cast<FunctionIR>(member.value.get());
    if (member.kind == MemberKind::GETTER)
        text += "get ";
    else if (member.kind == MemberKind::SETTER)
        text += "set ";
    if (fn && fn->is_async)
        text += "async ";
    if (fn && fn->is_generator)
        text += "*";
    text += member.key ? key_text(member.key.get(), member.computed) : std::string("constructor");
    if (member.optional)
        text += "?";
    if (!fn)
        return text + "();";
    text += fn->type_parameters + "(" + params_text(fn->params) + ")";
    if (!fn->return_type.empty())
        text += ": " + fn->return_type;
    return fn->body ? text + " " + braced(*fn->body) : text + ";";
}

std::string Emitter::class_text(const ClassIR& cls)
{
    std::string text = decorators_text(cls.decorators, cls.is_expression ? " " : "\n" + pad());
    if (cls.is_declare)
        text += "declare ";
    if (cls.is_abstract)
        text += "abstract ";
    text += "class";
    if (!cls.name.empty())
        text += " " + cls.name;
    text += cls.type_parameters;
    if (cls.super_class)
        text += " extends " + expr(cls.super_class.get()) + type_arguments(cls.super_type_arguments);
    for (size_t i = 0; i < cls.implements.size(); i++)
    {
        text += (i == 0 ? " implements " : ", ") + cls.implements[i];
    }

    if (cls.members.empty())
        return text + " {}";
    text += " {\n";
    level++;
    for (const auto& member : cls.members)
    {
        text += pad() + class_member_text(member) + "\n";
    }
    level--;
    return text + pad() + "}";
}

std::string Emitter::expr(const IRNode* node)
{
    if (!node)
        return "";
    DepthGuard guard(depth, options.max_depth, Phase::EMITTER, node->line, node->column);

    switch (node->kind)
    {
    case IRKind::IDENTIFIER:
        return static_cast<const IdentifierIR*>(node)->name;
    case IRKind::LITERAL:
    {
        auto literal = static_cast<const LiteralIR*>(node);
        if (literal->literal_kind == LiteralKind::STRING)
            return quote_string(literal->value);
        return literal->value;
    }
    case IRKind::TEMPLATE:
    {
        auto tpl = static_cast<const TemplateIR*>(node);
        std::string text = "`";
        for (size_t i = 0; i < tpl->quasis.size(); i++)
        {
            text += tpl->quasis[i];
            if (i < tpl->expressions.size())
                text += "${" + expr(tpl->expressions[i].get()) + "}";
        }
        return text + "`";
    }
    case IRKind::TAGGED_TEMPLATE:
    {
        auto tagged = static_cast<const TaggedTemplateIR*>(node);
        return expr(tagged->tag.get()) + type_arguments(tagged->type_arguments) + expr(tagged->quasi.get());
    }
    case IRKind::ARRAY:
    {
        auto array = static_cast<const ArrayIR*>(node);
        std::string text = "[" + expression_list(array->elements);
        // a trailing hole needs its own comma: [a, ,]
        if (!array->elements.empty() && array->elements.back()->kind == IRKind::OMITTED)
            text += ",";
        return text + "]";
    }
    case IRKind::OBJECT:
        return object_text(*static_cast<const ObjectIR*>(node));
    case IRKind::FUNCTION:
        return function_text(*static_cast<const FunctionIR*>(node));
    case IRKind::CLASS:
        return class_text(*static_cast<const ClassIR*>(node));
    case IRKind::COMPONENT:
        return component_text(*static_cast<const ComponentIR*>(node));
    case IRKind::UNARY:
    {
        auto unary = static_cast<const UnaryIR*>(node);
        std::string operand = expr(unary->operand.get());
        if (!unary->prefix)
            return operand + unary->op;
        if (is_word_operator(unary->op))
            return unary->op + " " + operand;
        // keep "- -x" and "+ +x" apart
        if (!operand.empty() && (operand[0] == '-' || operand[0] == '+') && unary->op.back() == operand[0])
            return unary->op + " " + operand;
        return unary->op + operand;
    }
    case IRKind::AWAIT:
        return "await " + expr(static_cast<const AwaitIR*>(node)->argument.get());
    case IRKind::YIELD:
    {
        auto yield = static_cast<const YieldIR*>(node);
        std::string text = yield->delegate ? "yield*" : "yield";
        if (yield->argument)
            text += " " + expr(yield->argument.get());
        return text;
    }
    case IRKind::BINARY:
    {
        auto binary = static_cast<const BinaryIR*>(node);
        return expr(binary->left.get()) + " " + binary->op + " " + expr(binary->right.get());
    }
    case IRKind::ASSIGNMENT:
    {
        auto assign = static_cast<const AssignmentIR*>(node);
        return expr(assign->target.get()) + " " + assign->op + " " + expr(assign->value.get());
    }
    case IRKind::CONDITIONAL:
    {
        auto cond = static_cast<const ConditionalIR*>(node);
        return expr(cond->test.get()) + " ? " + expr(cond->consequent.get()) + " : " + expr(cond->alternate.get());
    }
    case IRKind::CALL:
    {
        auto call = static_cast<const CallIR*>(node);
        return expr(call->callee.get()) + (call->optional ? "?." : "") + type_arguments(call->type_arguments) + "(" +
               expression_list(call->arguments) + ")";
    }
    case IRKind::NEW:
    {
        auto construct = static_cast<const NewIR*>(node);
        std::string text = "new " + expr(construct->callee.get()) + type_arguments(construct->type_arguments);
        if (construct->has_arguments)
            text += "(" + expression_list(construct->arguments) + ")";
        return text;
    }
    case IRKind::MEMBER:
    {
        auto member = static_cast<const MemberIR*>(node);
        std::string object = expr(member->object.get());
        if (member->computed_property)
            return object + (member->optional ? "?.[" : "[") + expr(member->computed_property.get()) + "]";
        return object + (member->optional ? "?." : ".") + member->property;
    }
    case IRKind::SPREAD:
        return "..." + expr(static_cast<const SpreadIR*>(node)->argument.get());
    case IRKind::SEQUENCE:
        return expression_list(static_cast<const SequenceIR*>(node)->expressions);
    case IRKind::PAREN:
        return "(" + expr(static_cast<const ParenIR*>(node)->expression.get()) + ")";
    case IRKind::AS:
    {
        auto as = static_cast<const AsIR*>(node);
        return expr(as->expression.get()) + " " + as->keyword + " " + as->type;
    }
    case IRKind::NON_NULL:
        return expr(static_cast<const NonNullIR*>(node)->expression.get()) + "!";
    case IRKind::ASSIGNMENT_PATTERN:
    {
        auto pattern = static_cast<const AssignmentPatternIR*>(node);
        return expr(pattern->target.get()) + " = " + expr(pattern->default_value.get());
    }
    case IRKind::OMITTED:
        return "";
    case IRKind::ELEMENT:
        return element_text(*static_cast<const ElementIR*>(node));
    case IRKind::COMPONENT_CALL:
        return component_call_text(*static_cast<const ComponentCallIR*>(node));
    case IRKind::FRAGMENT:
        return fragment_text(*static_cast<const FragmentIR*>(node));
    case IRKind::JSX_TEXT:
        return quote_string(static_cast<const JSXTextIR*>(node)->value);
    case IRKind::JSX_CHILD:
        return expr(static_cast<const JSXChildIR*>(node)->expression.get());
    default:
        ErrorHandler::compiler_error(Phase::EMITTER, "PSR-G001",
                                     std::string("Unsupported node kind '") + ir_kind_name(node->kind) +
                                         "' in expression position",
                                     node->line, node->column);
    }
}
