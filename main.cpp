#include "rain/app.hpp"

int main(int argc, char** argv) {
    rain::App app;
    return app.run(argc, argv);
}
