/*
 * Trace utilities.
 *
 * Use trace() for simple explicitly requested messages that need to
 * go the debug output stream.
 *
 * Use Trace(1,... for errors and Trace(2,... for informational messages.
 * Higher levels are progressively chattier and are filtered unless
 * TraceDebugLevel is raised.
 *
 * Expressions may be compiled on a UI thread while others are being
 * evaluated on device listener threads so everything in here is
 * guarded by one critical section.
 */

#ifndef TRACE_H
#define TRACE_H

#include <stdarg.h>
// for juce::String
#include <JuceHeader.h>

/****************************************************************************
 *                                                                          *
 *   							 SIMPLE TRACE                               *
 *                                                                          *
 ****************************************************************************/

extern bool TraceToDebug;
extern bool TraceToStdout;

void trace(const char *string, ...);
void vtrace(const char *string, va_list args);

void trace(juce::String& js);

/****************************************************************************
 *                                                                          *
 *   							 TRACE LEVELS                               *
 *                                                                          *
 ****************************************************************************/

/**
 * Trace records at this level or lower are emitted.
 *   0 nothing
 *   1 errors
 *   2 informational
 *   3 verbose, things like generated expression code
 */
extern int TraceDebugLevel;

/**
 * Interface of an object to receive trace messages as they
 * are emitted.  The console uses this to show messages, tests
 * use it to capture what an expression printed.
 */
class TraceListener {
  public:
    virtual ~TraceListener() {}
    virtual void traceEmit(const char* msg) = 0;
};

/**
 * The one global listener.
 */
extern TraceListener* GlobalTraceListener;

#define MAX_TRACE_MSG 1024

/****************************************************************************
 *                                                                          *
 *   						   TRACE FUNCTIONS                              *
 *                                                                          *
 ****************************************************************************/

// A fixed set of signatures rather than a variadic so that
// juce::String::toUTF8() converts to const char* at the call site.

void Trace(int level, const char* msg);
void Trace(int level, const char* msg, const char* arg);
void Trace(int level, const char* msg, const char* arg, const char* arg2);
void Trace(int level, const char* msg, const char* arg, const char* arg2, const char* arg3);
void Trace(int level, const char* msg, const char* arg, long l1);
void Trace(int level, const char* msg, const char* arg, const char* arg2, long l1);
void Trace(int level, const char* msg, const char* arg, long l1, long l2);
void Trace(int level, const char* msg, long l1);
void Trace(int level, const char* msg, long l1, long l2);
void Trace(int level, const char* msg, long l1, long l2, long l3);

// trace without checking level on a pre-formatted string
void Trace(const char* msg);

// sigh, get "ambiguous call to overloaded function"
// if it has the same name as above
void Tracej(juce::String msg);

#endif
