#ifndef APP_H
#define APP_H

#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <cstdio>

class wxLog;

class App : public wxApp
{
public:
	virtual bool OnInit() override;
	virtual int OnExit() override;

private:
	void OpenLogFile();

	FILE *m_logFile = nullptr;
	wxLog *m_previousLog = nullptr;
};

wxDECLARE_APP(App);

#endif // APP_H
