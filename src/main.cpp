#include "app/App.h"

int main(int argc, char* argv[]) {
    ringchart::App app;

    if (!app.init(argc, argv)) {
        app.shutdown();
        return 1;
    }

    app.run();
    app.shutdown();

    return 0;
}
