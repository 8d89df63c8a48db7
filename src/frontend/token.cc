#include "token.h"

const char* token_type_name(TokenType type)
{
    switch (type)
    {
    case TokenType::BREAK:
        return "BREAK";
    case TokenType::CASE:
        return "CASE";
    case TokenType::CATCH:
        return "CATCH";
    case TokenType::CLASS:
        return "CLASS";
    case TokenType::CONST:
        return "CONST";
    case TokenType::CONTINUE:
        return "CONTINUE";
    case TokenType::DEBUGGER:
        return "DEBUGGER";
    case TokenType::DEFAULT:
        return "DEFAULT";
    case TokenType::DELETE:
        return "DELETE";
    case TokenType::DO:
        return "DO";
    case TokenType::ELSE:
        return "ELSE";
    case TokenType::ENUM:
        return "ENUM";
    case TokenType::EXPORT:
        return "EXPORT";
    case TokenType::EXTENDS:
        return "EXTENDS";
    case TokenType::FINALLY:
        return "FINALLY";
    case TokenType::FOR:
        return "FOR";
    case TokenType::FUNCTION:
        return "FUNCTION";
    case TokenType::IF:
        return "IF";
    case TokenType::IMPORT:
        return "IMPORT";
    case TokenType::IN:
        return "IN";
    case TokenType::INSTANCEOF:
        return "INSTANCEOF";
    case TokenType::NEW:
        return "NEW";
    case TokenType::RETURN:
        return "RETURN";
    case TokenType::SUPER:
        return "SUPER";
    case TokenType::SWITCH:
        return "SWITCH";
    case TokenType::THIS:
        return "THIS";
    case TokenType::THROW:
        return "THROW";
    case TokenType::TRY:
        return "TRY";
    case TokenType::TYPEOF:
        return "TYPEOF";
    case TokenType::VAR:
        return "VAR";
    case TokenType::VOID:
        return "VOID";
    case TokenType::WHILE:
        return "WHILE";
    case TokenType::TRUE:
        return "TRUE";
    case TokenType::FALSE:
        return "FALSE";
    case TokenType::NULL_KEYWORD:
        return "NULL_KEYWORD";
    case TokenType::COMPONENT:
        return "COMPONENT";
    case TokenType::INTERFACE:
        return "INTERFACE";
    case TokenType::TYPE:
        return "TYPE";
    case TokenType::NAMESPACE:
        return "NAMESPACE";
    case TokenType::MODULE:
        return "MODULE";
    case TokenType::DECLARE:
        return "DECLARE";
    case TokenType::ABSTRACT:
        return "ABSTRACT";
    case TokenType::IMPLEMENTS:
        return "IMPLEMENTS";
    case TokenType::ASYNC:
        return "ASYNC";
    case TokenType::AWAIT:
        return "AWAIT";
    case TokenType::YIELD:
        return "YIELD";
    case TokenType::LET:
        return "LET";
    case TokenType::STATIC:
        return "STATIC";
    case TokenType::AS:
        return "AS";
    case TokenType::SATISFIES:
        return "SATISFIES";
    case TokenType::FROM:
        return "FROM";
    case TokenType::OF:
        return "OF";
    case TokenType::GET:
        return "GET";
    case TokenType::SET:
        return "SET";
    case TokenType::KEYOF:
        return "KEYOF";
    case TokenType::READONLY:
        return "READONLY";
    case TokenType::PUBLIC:
        return "PUBLIC";
    case TokenType::PRIVATE:
        return "PRIVATE";
    case TokenType::PROTECTED:
        return "PROTECTED";
    case TokenType::NUMBER_LITERAL:
        return "NUMBER_LITERAL";
    case TokenType::BIGINT_LITERAL:
        return "BIGINT_LITERAL";
    case TokenType::STRING_LITERAL:
        return "STRING_LITERAL";
    case TokenType::REGEX_LITERAL:
        return "REGEX_LITERAL";
    case TokenType::NO_SUBSTITUTION_TEMPLATE:
        return "NO_SUBSTITUTION_TEMPLATE";
    case TokenType::TEMPLATE_HEAD:
        return "TEMPLATE_HEAD";
    case TokenType::TEMPLATE_MIDDLE:
        return "TEMPLATE_MIDDLE";
    case TokenType::TEMPLATE_TAIL:
        return "TEMPLATE_TAIL";
    case TokenType::IDENTIFIER:
        return "IDENTIFIER";
    case TokenType::ASSIGN:
        return "ASSIGN";
    case TokenType::PLUS_ASSIGN:
        return "PLUS_ASSIGN";
    case TokenType::MINUS_ASSIGN:
        return "MINUS_ASSIGN";
    case TokenType::STAR_ASSIGN:
        return "STAR_ASSIGN";
    case TokenType::SLASH_ASSIGN:
        return "SLASH_ASSIGN";
    case TokenType::PERCENT_ASSIGN:
        return "PERCENT_ASSIGN";
    case TokenType::STAR_STAR_ASSIGN:
        return "STAR_STAR_ASSIGN";
    case TokenType::LSHIFT_ASSIGN:
        return "LSHIFT_ASSIGN";
    case TokenType::RSHIFT_ASSIGN:
        return "RSHIFT_ASSIGN";
    case TokenType::URSHIFT_ASSIGN:
        return "URSHIFT_ASSIGN";
    case TokenType::AMPERSAND_ASSIGN:
        return "AMPERSAND_ASSIGN";
    case TokenType::PIPE_ASSIGN:
        return "PIPE_ASSIGN";
    case TokenType::CARET_ASSIGN:
        return "CARET_ASSIGN";
    case TokenType::AND_ASSIGN:
        return "AND_ASSIGN";
    case TokenType::OR_ASSIGN:
        return "OR_ASSIGN";
    case TokenType::NULLISH_ASSIGN:
        return "NULLISH_ASSIGN";
    case TokenType::EQ:
        return "EQ";
    case TokenType::NEQ:
        return "NEQ";
    case TokenType::STRICT_EQ:
        return "STRICT_EQ";
    case TokenType::STRICT_NEQ:
        return "STRICT_NEQ";
    case TokenType::LT:
        return "LT";
    case TokenType::GT:
        return "GT";
    case TokenType::LTE:
        return "LTE";
    case TokenType::GTE:
        return "GTE";
    case TokenType::PLUS:
        return "PLUS";
    case TokenType::MINUS:
        return "MINUS";
    case TokenType::STAR:
        return "STAR";
    case TokenType::SLASH:
        return "SLASH";
    case TokenType::PERCENT:
        return "PERCENT";
    case TokenType::STAR_STAR:
        return "STAR_STAR";
    case TokenType::PLUS_PLUS:
        return "PLUS_PLUS";
    case TokenType::MINUS_MINUS:
        return "MINUS_MINUS";
    case TokenType::LSHIFT:
        return "LSHIFT";
    case TokenType::RSHIFT:
        return "RSHIFT";
    case TokenType::URSHIFT:
        return "URSHIFT";
    case TokenType::AMPERSAND:
        return "AMPERSAND";
    case TokenType::PIPE:
        return "PIPE";
    case TokenType::CARET:
        return "CARET";
    case TokenType::NOT:
        return "NOT";
    case TokenType::TILDE:
        return "TILDE";
    case TokenType::AND:
        return "AND";
    case TokenType::OR:
        return "OR";
    case TokenType::NULLISH:
        return "NULLISH";
    case TokenType::LPAREN:
        return "LPAREN";
    case TokenType::RPAREN:
        return "RPAREN";
    case TokenType::LBRACE:
        return "LBRACE";
    case TokenType::RBRACE:
        return "RBRACE";
    case TokenType::LBRACKET:
        return "LBRACKET";
    case TokenType::RBRACKET:
        return "RBRACKET";
    case TokenType::SEMICOLON:
        return "SEMICOLON";
    case TokenType::COMMA:
        return "COMMA";
    case TokenType::DOT:
        return "DOT";
    case TokenType::ELLIPSIS:
        return "ELLIPSIS";
    case TokenType::QUESTION:
        return "QUESTION";
    case TokenType::QUESTION_DOT:
        return "QUESTION_DOT";
    case TokenType::COLON:
        return "COLON";
    case TokenType::ARROW:
        return "ARROW";
    case TokenType::AT:
        return "AT";
    case TokenType::GENERIC_OPEN:
        return "GENERIC_OPEN";
    case TokenType::GENERIC_CLOSE:
        return "GENERIC_CLOSE";
    case TokenType::JSX_TAG_START:
        return "JSX_TAG_START";
    case TokenType::JSX_CLOSE_TAG_START:
        return "JSX_CLOSE_TAG_START";
    case TokenType::JSX_TAG_END:
        return "JSX_TAG_END";
    case TokenType::JSX_SELF_CLOSE:
        return "JSX_SELF_CLOSE";
    case TokenType::JSX_TEXT:
        return "JSX_TEXT";
    case TokenType::ERROR:
        return "ERROR";
    case TokenType::END_OF_FILE:
        return "END_OF_FILE";
    }
    return "UNKNOWN";
}

bool is_contextual_keyword(TokenType type)
{
    switch (type)
    {
    case TokenType::COMPONENT:
    case TokenType::INTERFACE:
    case TokenType::TYPE:
    case TokenType::NAMESPACE:
    case TokenType::MODULE:
    case TokenType::DECLARE:
    case TokenType::ABSTRACT:
    case TokenType::IMPLEMENTS:
    case TokenType::ASYNC:
    case TokenType::AWAIT:
    case TokenType::YIELD:
    case TokenType::LET:
    case TokenType::STATIC:
    case TokenType::AS:
    case TokenType::SATISFIES:
    case TokenType::FROM:
    case TokenType::OF:
    case TokenType::GET:
    case TokenType::SET:
    case TokenType::KEYOF:
    case TokenType::READONLY:
    case TokenType::PUBLIC:
    case TokenType::PRIVATE:
    case TokenType::PROTECTED:
        return true;
    default:
        return false;
    }
}

bool is_keyword(TokenType type)
{
    if (is_contextual_keyword(type))
        return true;
    return type >= TokenType::BREAK && type <= TokenType::NULL_KEYWORD;
}
