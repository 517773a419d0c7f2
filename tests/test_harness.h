#pragma once
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QThread>
#include <iostream>
#include <string>

// Simple assertion helpers
static int tests_run = 0;
static int tests_failed = 0;
#define EXPECT_EQ(a,b) do { ++tests_run; if(!((a)==(b))){ std::cerr<<"Test failed: Expected "<<(b)<<" got "<<(a)<<" at "<<__FILE__<<":"<<__LINE__<<"\n"; ++tests_failed; }} while(0)
#define EXPECT_TRUE(c) do { ++tests_run; if(!(c)){ std::cerr<<"Test failed: "<<#c<<" at "<<__FILE__<<":"<<__LINE__<<"\n"; ++tests_failed; }} while(0)
#define EXPECT_FALSE(c) EXPECT_TRUE(!(c))
#define EXPECT_STATE(a,b) do { ++tests_run; if((a)!=(b)){ std::cerr<<"Test failed: Expected state "<<SimShell::to_string(b)<<" got "<<SimShell::to_string(a)<<" at "<<__FILE__<<":"<<__LINE__<<"\n"; ++tests_failed; }} while(0)
#define EXPECT_THROWS(expr) do { ++tests_run; bool thrown_ = false; try { expr; } catch(const std::exception&) { thrown_ = true; } if(!thrown_){ std::cerr<<"Test failed: "<<#expr<<" did not throw at "<<__FILE__<<":"<<__LINE__<<"\n"; ++tests_failed; }} while(0)

// Spins the event loop until pred holds or timeout_ms elapses.
template <typename Pred>
bool wait_until(Pred pred, int timeout_ms = 5000){
    QElapsedTimer timer;
    timer.start();
    while(!pred()){
        if(timer.elapsed() > timeout_ms) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

// Keeps the event loop running for ms so queued completions get delivered.
inline void drain(int ms){
    QElapsedTimer timer;
    timer.start();
    while(timer.elapsed() < ms){
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
}

inline int finish(const char* suite){
    if(tests_failed==0){
        std::cout<<suite<<": all "<<tests_run<<" checks passed\n";
        return 0;
    }
    std::cerr<<suite<<": "<<tests_failed<<" of "<<tests_run<<" checks failed\n";
    return 1;
}
