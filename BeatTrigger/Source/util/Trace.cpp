/*
 * Trace utilities.
 *
 * Expressions are compiled on the UI thread and evaluated on device
 * listener threads that are allowed to block briefly, so records are
 * rendered immediately under the critical section.
 *
 * Level 1 messages are prefixed with "ERROR: " so they stand out in logs.
 */

// CriticalSection/ScopedLock
#include <JuceHeader.h>

#include <stdio.h>
#include <stdarg.h>

#include "Trace.h"

/****************************************************************************
 *                                                                          *
 *   							 SIMPLE TRACE                               *
 *                                                                          *
 ****************************************************************************/

bool TraceToDebug = true;
bool TraceToStdout = false;

int TraceDebugLevel = 1;

TraceListener* GlobalTraceListener = nullptr;

juce::CriticalSection TraceCriticalSection;

// internal method that deals with a single char array
void traceInternal(const char* buf)
{
    const juce::ScopedLock lock (TraceCriticalSection);

	if (TraceToStdout) {
		printf("%s", buf);
		fflush(stdout);
	}
	else if (TraceToDebug) {
        fprintf(stderr, "%s", buf);
        fflush(stderr);
	}

    if (GlobalTraceListener != nullptr)
      GlobalTraceListener->traceEmit(buf);
}

void vtrace(const char *string, va_list args)
{
	char buf[MAX_TRACE_MSG];
	vsnprintf(buf, sizeof(buf), string, args);
    traceInternal(buf);
}

void trace(const char *string, ...)
{
    va_list args;
    va_start(args, string);
	vtrace(string, args);
    va_end(args);
}

void trace(juce::String& s)
{
    // hack, these typically are using String concatenation and don't have newlines
    s += "\n";
    traceInternal(s.toUTF8());
}

/****************************************************************************
 *                                                                          *
 *   							TRACE RECORDS                               *
 *                                                                          *
 ****************************************************************************/

/**
 * Render a message with its arguments and send it out.
 * This is the only variadic here and it is private, the public signatures
 * above have already coerced everything to const char* or long.
 */
static void TraceFormat(int level, const char* msg, ...)
{
    if (level > TraceDebugLevel)
      return;

    if (msg == nullptr || strlen(msg) == 0)
      msg = "!!!!!! MISSING TRACE MESSAGE !!!!!!";

    char buffer[MAX_TRACE_MSG];
    int prefix = 0;
    if (level == 1) {
        strcpy(buffer, "ERROR: ");
        prefix = (int)strlen(buffer);
    }

    va_list args;
    va_start(args, msg);
    vsnprintf(buffer + prefix, sizeof(buffer) - (size_t)prefix, msg, args);
    va_end(args);

    // this is so easy to miss
    int len = (int)strlen(buffer);
    if (len > 0 && len < (int)sizeof(buffer) - 1) {
        if (buffer[len-1] != '\n') {
            buffer[len] = '\n';
            buffer[len+1] = 0;
        }
    }

    traceInternal(buffer);
}

/**
 * Avoid passing null through to vsnprintf for %s
 */
static const char* safe(const char* arg)
{
    return (arg != nullptr) ? arg : "";
}

void Trace(int level, const char* msg)
{
    TraceFormat(level, msg);
}

void Trace(int level, const char* msg, const char* arg)
{
    TraceFormat(level, msg, safe(arg));
}

void Trace(int level, const char* msg, const char* arg, const char* arg2)
{
    TraceFormat(level, msg, safe(arg), safe(arg2));
}

void Trace(int level, const char* msg, const char* arg, const char* arg2, const char* arg3)
{
    TraceFormat(level, msg, safe(arg), safe(arg2), safe(arg3));
}

void Trace(int level, const char* msg, const char* arg, long l1)
{
    TraceFormat(level, msg, safe(arg), l1);
}

void Trace(int level, const char* msg, const char* arg, const char* arg2, long l1)
{
    TraceFormat(level, msg, safe(arg), safe(arg2), l1);
}

void Trace(int level, const char* msg, const char* arg, long l1, long l2)
{
    TraceFormat(level, msg, safe(arg), l1, l2);
}

void Trace(int level, const char* msg, long l1)
{
    TraceFormat(level, msg, l1);
}

void Trace(int level, const char* msg, long l1, long l2)
{
    TraceFormat(level, msg, l1, l2);
}

void Trace(int level, const char* msg, long l1, long l2, long l3)
{
    TraceFormat(level, msg, l1, l2, l3);
}

/**
 * Pre-formatted message, no level check.
 * Used for expression println.
 */
void Trace(const char* msg)
{
    juce::String s (safe(msg));
    if (!s.endsWithChar('\n'))
      s += "\n";
    traceInternal(s.toUTF8());
}

void Tracej(juce::String msg)
{
    Trace(msg.toUTF8());
}
