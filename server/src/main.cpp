#include "server_app.h"

int main()
{
    scripthub::ServerApp app;
    return app.run();
}
