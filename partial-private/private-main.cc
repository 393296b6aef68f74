#include <config.h>

#include <partial-private/private-main.h>

#include <signal.h>

void InitSignals()							/*{{{*/
{
   // output might be piped into head and the like
   signal(SIGPIPE,SIG_IGN);
}
									/*}}}*/
