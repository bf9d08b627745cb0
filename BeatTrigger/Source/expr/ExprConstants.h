/**
 * Constants shared by the expression engine and the applications
 * that use it.
 */

#pragma once

/**
 * What a block of source text is meant to be.
 * Expressions are wrapped in a generated function with a binding
 * prelude, shared definitions are evaluated directly into the workspace.
 */
typedef enum {
    ExprSourceExpression,
    ExprSourceShared
} ExprSourceKind;

/**
 * The states an expression slot moves through.
 */
typedef enum {
    ExprSlotEmpty,
    ExprSlotCompiling,
    ExprSlotInstalled,
    ExprSlotFailed
} ExprSlotState;

/**
 * Names of the parameters of the generated expression function.
 * The user body sees these directly.
 */
#define EXPR_PARAM_STATUS "status"
#define EXPR_PARAM_EVENT "event"
#define EXPR_PARAM_TRIGGER_DATA "trigger-data"
#define EXPR_PARAM_GLOBALS "globals"
#define EXPR_PARAM_LOCALS "locals"

/**
 * Name given to the generated function, shows up in printed values
 * and in stack overflow messages.
 */
#define EXPR_FUNCTION_NAME "expression"

/**
 * Suffix added to generated symbol names.
 */
#define EXPR_GENSYM_SUFFIX "__auto__"

/**
 * Evaluation depth before we give up and call it a stack overflow.
 * Expressions are evaluated on device listener threads with
 * ordinary stack sizes so this is conservative.
 */
const int ExprMaxEvalDepth = 1000;

/**
 * Nesting depth the reader will accept.  Everything after the reader
 * walks the parsed tree recursively so this bounds them too.
 */
const int ExprMaxReadDepth = 1000;

/**
 * Maximum macro expansions of a single form before we assume
 * a macro is expanding into itself.
 */
const int ExprMaxExpansions = 500;
